#ifndef CSGIR_COMMON_ERRORS_HPP
#define CSGIR_COMMON_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace csgir {

// Base of everything the library throws on its own account.
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A node was built with structurally invalid arity.
class ConstructionError : public Error {
public:
    using Error::Error;
};

class DimensionalityError : public Error {
public:
    using Error::Error;
};

// An argument that should imply 2D or 3D implies neither.
class DimensionalityZeroError : public DimensionalityError {
public:
    using DimensionalityError::DimensionalityError;
};

// 2D and 3D geometry meet where only one is allowed.
class DimensionalityMismatchError : public DimensionalityError {
public:
    using DimensionalityError::DimensionalityError;
};

// Something that is not an expression was offered as one.
class ExpressionTypeError : public Error {
public:
    using Error::Error;
};

class StringEncodingError : public Error {
public:
    using Error::Error;
};

class OperatorError : public Error {
public:
    using Error::Error;
};

class ConfigError : public Error {
public:
    using Error::Error;
};

}  // namespace csgir

#endif // CSGIR_COMMON_ERRORS_HPP
