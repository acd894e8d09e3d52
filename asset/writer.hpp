#ifndef CSGIR_ASSET_WRITER_HPP
#define CSGIR_ASSET_WRITER_HPP

#include "assembly.hpp"
#include <transpiler/transpiler.hpp>
#include <filesystem>
#include <ostream>
#include <vector>

namespace csgir {

std::filesystem::path compose_scad_output_path(const std::filesystem::path& directory,
                                               const Asset& asset);

// Transpile a content sequence, with a blank line after each expression.
void write_scad(std::ostream& out, const ir::Children& content,
                const scad::Transpiler& transpiler = {});

// Writes refined assets as .scad files into one directory.
class Writer {
public:
    explicit Writer(std::filesystem::path scad_dir, AssemblyOptions options = {});

    // Refine and write each asset. Returns the assets actually written.
    std::vector<Asset> write(const std::vector<Asset>& assets);

    // Write anonymous content, one asset per entry, named after this batch.
    std::vector<Asset> write(const std::vector<ir::Children>& contents);

    const std::filesystem::path& scad_dir() const { return scad_dir_; }

private:
    void write_file(const Asset& asset) const;

    std::filesystem::path scad_dir_;
    AssemblyOptions options_;
    scad::Transpiler transpiler_;
    int next_batch_ = 0;
};

}  // namespace csgir

#endif // CSGIR_ASSET_WRITER_HPP
