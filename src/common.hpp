#pragma once

#include <format>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

#include <SDL3/SDL_error.h>

enum class ErrorKind
{
    InvalidHandle,
    Device,
    UnknownIdentifier,
};

struct BindingError : std::runtime_error
{
    ErrorKind kind;

    BindingError(ErrorKind _kind, const std::string& message)
        : std::runtime_error(message)
        , kind(_kind)
    {}
};

template<typename T>
struct NamedConstant
{
    const char* name;
    T value;
};

template<typename... Args>
void Log(std::format_string<Args...> fmt, Args&&... args)
{
    std::cout << std::vformat(fmt.get(), std::make_format_args(args...)) << '\n';
}

template<typename... Args>
[[noreturn]] void Error(ErrorKind kind, std::format_string<Args...> fmt, Args&&... args)
{
    auto message = std::vformat(fmt.get(), std::make_format_args(args...));
    std::cout << "[ERROR] " << message << '\n';
    throw BindingError(kind, message);
}

// Raises with SDL's last error as the message
[[noreturn]] inline
void SdlError(ErrorKind kind)
{
    Error(kind, "{}", SDL_GetError());
}

template<typename Fn>
struct Defer
{
    Fn fn;

    Defer(Fn&& _fn)
        : fn(std::move(_fn))
    {}

    ~Defer()
    {
        fn();
    }
};
