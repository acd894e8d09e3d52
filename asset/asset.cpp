#include "asset.hpp"

namespace csgir {

ContentThunk constant_content(ir::Children expressions) {
    return [expressions = std::move(expressions)]() { return expressions; };
}

Asset::Asset() : content(constant_content({})) {}

Asset::Asset(ContentThunk thunk) : content(std::move(thunk)) {}

Asset::Asset(const ir::Expression& expression) : content(constant_content({expression})) {}

Asset::Asset(ir::Children expressions) : content(constant_content(std::move(expressions))) {}

Asset Asset::with_content(ContentThunk thunk) const {
    Asset copy = *this;
    copy.content = std::move(thunk);
    return copy;
}

Asset Asset::with_content(ir::Children expressions) const {
    return with_content(constant_content(std::move(expressions)));
}

Asset Asset::with_name(std::string new_name) const {
    Asset copy = *this;
    copy.name = std::move(new_name);
    return copy;
}

Asset Asset::with_modules(std::vector<Asset> new_modules) const {
    Asset copy = *this;
    copy.modules = std::move(new_modules);
    return copy;
}

Asset Asset::with_mirrored(bool value) const {
    Asset copy = *this;
    copy.mirrored = value;
    return copy;
}

std::string untitled_name(int batch, int ordinal) {
    return "untitled_" + std::to_string(batch) + "_" + std::to_string(ordinal);
}

Asset package_asset(ContentThunk thunk, int batch, int ordinal) {
    Asset asset(std::move(thunk));
    asset.name = untitled_name(batch, ordinal);
    return asset;
}

}  // namespace csgir
