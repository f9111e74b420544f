/**
 * @file model.cpp
 * @brief tiny out-of-line helpers for the data model
 */
#include "trib/model/model.hpp"

namespace trib::model
{

auto to_string(ErrorKind kind) -> std::string
{
    switch (kind)
    {
    case ErrorKind::Configuration:
        return "ConfigurationError";
    case ErrorKind::InvalidLoad:
        return "InvalidLoad";
    case ErrorKind::InvalidBeam:
        return "InvalidBeam";
    }
    return "UnknownError";
}

} // namespace trib::model
