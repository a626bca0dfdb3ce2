#include "vigil/error.hpp"

#include <algorithm>
#include <utility>


namespace vigil {

Status Status::invalid_configuration(std::string detail) {
    Status s;
    s.code = Error::InvalidConfiguration;
    s.detail = std::move(detail);
    return s;
}

Status Status::aggregate_failure(std::vector<std::string> names) {
    std::sort(names.begin(), names.end());
    Status s;
    s.code = Error::AggregateFailure;
    s.expired = std::move(names);
    return s;
}

std::string Status::message() const {
    switch (code) {
    case Error::None:
        return "ok";
    case Error::InvalidConfiguration:
        return "invalid configuration: " + detail;
    case Error::AggregateFailure: {
        std::string out = "watchdog timed out on the following services: ";
        for (std::size_t i = 0; i < expired.size(); ++i) {
            if (i != 0) {
                out += ", ";
            }
            out += expired[i];
        }
        return out;
    }
    }
    return std::string(to_string(code));
}

} // namespace vigil
