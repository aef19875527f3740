#pragma once

#include <stdexcept>
#include <string>

namespace blobsim {

// action index other than 0 (left) or 1 (right)
class InvalidActionException: public std::runtime_error {
public:
    InvalidActionException(const std::string &what): std::runtime_error(what) {}
};

// degenerate environment, agent or trainer parameters
class ConfigurationException: public std::runtime_error {
public:
    ConfigurationException(const std::string &what): std::runtime_error(what) {}
};

// not enough transitions stored to draw the requested batch
class ReplayUnderflowException: public std::runtime_error {
public:
    ReplayUnderflowException(const std::string &what): std::runtime_error(what) {}
};

// missing, unreadable or incompatible parameter snapshot
class SnapshotException: public std::runtime_error {
public:
    SnapshotException(const std::string &what): std::runtime_error(what) {}
};

}
