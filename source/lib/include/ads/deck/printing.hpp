#pragma once

#include <string>

struct Printing
{
    std::string m_SetCode;
    std::string m_CollectorNumber;

    bool operator==(const Printing&) const = default;
};
