#pragma once

#include <neo/pp.hpp>

#include <boost/leaf/error.hpp>
#include <boost/leaf/on_error.hpp>
#include <boost/leaf/result.hpp>

namespace relpack {

/// The return type of the filesystem helpers: a value, or an in-flight LEAF error
using boost::leaf::result;

using boost::leaf::current_error;
using boost::leaf::new_error;

}  // namespace relpack

/**
 * @brief Attach the given error object to any error that leaves the enclosing scope, whether by
 * exception or by a failed relpack::result.
 *
 * The expression is evaluated only when an error occurs, so it may refer to locals that change
 * during the scope (e.g. the current release stage).
 */
#define RELPACK_E_SCOPE(...)                                                                       \
    auto NEO_CONCAT(_relpack_e_scope_, __LINE__)                                                   \
        = ::boost::leaf::on_error([&] { return __VA_ARGS__; })
