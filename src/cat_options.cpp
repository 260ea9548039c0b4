#include "objcat/cat/options.hpp"

namespace objcat {

std::string CatOptions::validate() const {
    if (part_size == 0) {
        return "part size must be positive";
    }
    if (concurrency == 0) {
        return "concurrency must be positive";
    }
    if (range_timeout.count() <= 0) {
        return "range timeout must be positive";
    }
    if (connect_timeout.count() <= 0) {
        return "connect timeout must be positive";
    }
    if (retry_base_delay.count() < 0 || retry_max_delay < retry_base_delay) {
        return "retry delays must satisfy 0 <= base <= max";
    }
    return "";
}

} // namespace objcat
