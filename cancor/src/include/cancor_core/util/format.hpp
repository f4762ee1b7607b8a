#pragma once
#include <cstdio>
#include <memory>
#include <sstream>
#include <string>
#include <cancor_core/util/exceptions.hpp>

namespace cancor_core {
namespace util {

template<typename ... Args>
std::string format(
    const char* fmt, 
    Args ... args
)
{
    int size_s = std::snprintf( nullptr, 0, fmt, args ... ) + 1; // Extra space for '\0'
    if (size_s <= 0) throw util::cancor_core_error("Error during formatting.");
    auto size = static_cast<size_t>(size_s);
    std::unique_ptr<char[]> buf( new char[ size ] );
    std::snprintf( buf.get(), size, fmt, args ... );
    return std::string( buf.get(), buf.get() + size - 1 ); // We don't want the '\0' inside
}

/*
 * Renders a container as "[a, b, c]" for error messages.
 */
template <class ContainerType>
std::string format_list(
    const ContainerType& v
)
{
    std::stringstream ss;
    ss << "[";
    for (size_t i = 0; i < static_cast<size_t>(v.size()); ++i) {
        if (i) ss << ", ";
        ss << v[i];
    }
    ss << "]";
    return ss.str();
}

} // namespace util
} // namespace cancor_core
