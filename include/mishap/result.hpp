#pragma once

#include <boost/outcome/try.hpp>

#include <mishap/error.hpp>
#include <mishap/error/error_exception.hpp>
#include <mishap/error/result_policy.hpp>

// NOLINTBEGIN(cppcoreguidelines-macro-usage)

// MISHAP_TRY(expr) returns early on failure, MISHAP_TRY(v, expr) additionally
// binds the value of expr to `auto &&v`
#define MISHAP_TRY(...) BOOST_OUTCOME_TRY(__VA_ARGS__)

// NOLINTEND(cppcoreguidelines-macro-usage)
