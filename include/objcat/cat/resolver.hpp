#pragma once

#include "objcat/cat/error.hpp"
#include "objcat/cat/target.hpp"
#include "objcat/cat/wildcard.hpp"
#include "objcat/core/constants.hpp"
#include "objcat/storage/backend.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace objcat {

struct ResolveResult {
    bool success = false;
    std::vector<ObjectDescriptor> objects;  // ascending key order
    std::optional<CatError> error;
    uint32_t list_requests = 0;
};

// Expands a target into the ordered list of objects to stream.
//
//   exact key  -> one descriptor, no request
//   prefix/    -> objects directly under the prefix; none is not an error
//   pattern    -> objects under the literal prefix that match; none is NoMatch
class TargetResolver {
public:
    TargetResolver(const ObjectStore& store,
                   const WildcardMatcher& matcher,
                   uint32_t list_page_size = constants::DEFAULT_LIST_MAX_KEYS);

    ResolveResult resolve(const Target& target) const;

private:
    // Pages through a listing until exhausted
    bool list_all(const ListOptions& options,
                  std::vector<ListEntry>& entries,
                  ResolveResult& result) const;

    const ObjectStore& store_;
    const WildcardMatcher& matcher_;
    uint32_t list_page_size_;
};

} // namespace objcat
