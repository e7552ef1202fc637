#pragma once

#include <coderun/concat_tostr.hh>
#include <coderun/macros/stringify.hh>
#include <stdexcept>

// Very useful - includes exception origin
#define THROW(...)                                                                     \
    throw std::runtime_error(                                                          \
        concat_tostr(__VA_ARGS__, " (thrown at " __FILE__ ":" STRINGIFY(__LINE__) ")") \
    )

// Like THROW() but throws an exception of type @p exception_type constructible from
// std::string
#define THROW_AS(exception_type, ...)                                                  \
    throw exception_type(                                                              \
        concat_tostr(__VA_ARGS__, " (thrown at " __FILE__ ":" STRINGIFY(__LINE__) ")") \
    )
