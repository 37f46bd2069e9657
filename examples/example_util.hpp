#pragma once

#include <cstdlib>
#include <iostream>
#include <string>
#include <otpxx/detail/result.hpp>

inline void print_error(const otpxx::error_info& err)
{
    std::cerr << "Error: " << otpxx::to_string(err.code) << " - " << err.message << "\n";
    if (!err.detail.empty())
        std::cerr << "Detail: " << err.detail << "\n";
    if (err.sys)
        std::cerr << "Sys: " << err.sys.message() << "\n";
    std::cerr << "Where: " << err.where.file_name() << ":" << err.where.line()
              << " " << err.where.function_name() << "\n";
}

inline std::string env_or(const char* name, std::string fallback)
{
    const char* value = std::getenv(name);
    return value != nullptr && *value != '\0' ? std::string(value) : fallback;
}
