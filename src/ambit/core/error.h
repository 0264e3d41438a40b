// error.h created on 2026-09-12 as part of ambit project
//
// Copyright 2026 Radek Brich
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#ifndef AMBIT_CORE_ERROR_H
#define AMBIT_CORE_ERROR_H

#include <exception>
#include <string>

namespace ambit::core {


class Error: public std::exception {
public:
    explicit Error(std::string msg) : m_msg(std::move(msg)) {}

    const char* what() const noexcept override {
        return m_msg.c_str();
    }

    const std::string& msg() const noexcept { return m_msg; }

private:
    std::string m_msg;
};


} // namespace ambit::core

#endif // AMBIT_CORE_ERROR_H
