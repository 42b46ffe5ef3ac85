#pragma once
#include <precompiled.hpp>

#ifndef TEEPROXY_PROJECT_NAME
static_assert(false, "TEEPROXY_PROJECT_NAME not defined");
#else
static_assert(std::is_convertible_v<decltype(TEEPROXY_PROJECT_NAME), std::string>, "TEEPROXY_PROJECT_NAME not convertible to string");
#endif
