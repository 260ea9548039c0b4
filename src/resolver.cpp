#include "objcat/cat/resolver.hpp"
#include "objcat/core/log.hpp"

#include <algorithm>
#include <type_traits>
#include <utility>
#include <variant>

namespace objcat {

namespace {

ObjectDescriptor descriptor_from(const ListEntry& entry) {
    ObjectDescriptor d;
    d.key = entry.key;
    d.size = entry.size;
    d.etag = entry.etag;
    return d;
}

void sort_by_key(std::vector<ObjectDescriptor>& objects) {
    // std::string compares as unsigned bytes
    std::sort(objects.begin(), objects.end(),
              [](const ObjectDescriptor& a, const ObjectDescriptor& b) { return a.key < b.key; });
}

}  // namespace

TargetResolver::TargetResolver(const ObjectStore& store,
                               const WildcardMatcher& matcher,
                               uint32_t list_page_size)
    : store_(store)
    , matcher_(matcher)
    , list_page_size_(list_page_size == 0 ? constants::DEFAULT_LIST_MAX_KEYS : list_page_size) {}

bool TargetResolver::list_all(const ListOptions& options,
                              std::vector<ListEntry>& entries,
                              ResolveResult& result) const {
    ListOptions page = options;
    page.max_keys = list_page_size_;

    while (true) {
        ListResult listed = store_.list(page);
        result.list_requests++;

        if (!listed.success) {
            result.error = CatError::list_failure(listed.error_message);
            return false;
        }

        log_trace("list prefix=\"%s\" delimiter=\"%s\": %zu entries%s",
                  page.prefix.c_str(), page.delimiter.c_str(), listed.entries.size(),
                  listed.truncated ? " (truncated)" : "");

        for (auto& entry : listed.entries) {
            entries.push_back(std::move(entry));
        }

        if (!listed.truncated) {
            return true;
        }
        if (listed.continuation_token.empty()) {
            result.error = CatError::list_failure("truncated listing without continuation token");
            return false;
        }
        page.continuation_token = listed.continuation_token;
    }
}

ResolveResult TargetResolver::resolve(const Target& target) const {
    ResolveResult result;
    TargetKind kind = classify_target(target);

    if (target.version_id && !std::holds_alternative<ExactKey>(kind)) {
        result.error = CatError::invalid_version_scope();
        return result;
    }

    std::visit([&](const auto& t) {
        using T = std::decay_t<decltype(t)>;

        if constexpr (std::is_same_v<T, ExactKey>) {
            ObjectDescriptor d;
            d.key = t.key;
            d.version_id = target.version_id;
            result.objects.push_back(std::move(d));
            result.success = true;

        } else if constexpr (std::is_same_v<T, PrefixTarget>) {
            ListOptions options;
            options.prefix = t.prefix;
            options.delimiter = std::string(1, constants::KEY_SEPARATOR);

            std::vector<ListEntry> entries;
            if (!list_all(options, entries, result)) {
                return;
            }
            for (const auto& entry : entries) {
                // Sub-prefixes and the zero-length "directory" marker itself
                if (entry.is_directory || (entry.key == t.prefix && entry.size == 0)) {
                    continue;
                }
                result.objects.push_back(descriptor_from(entry));
            }
            sort_by_key(result.objects);
            result.success = true;

        } else {
            std::string invalid = validate_pattern(t.pattern);
            if (!invalid.empty()) {
                result.error = CatError::invalid_pattern(t.pattern, invalid);
                return;
            }

            ListOptions options;
            options.prefix = t.literal_prefix;

            std::vector<ListEntry> entries;
            if (!list_all(options, entries, result)) {
                return;
            }
            for (const auto& entry : entries) {
                if (entry.is_directory || entry.key.empty() ||
                    entry.key.back() == constants::KEY_SEPARATOR) {
                    continue;
                }
                if (matcher_.matches(t.pattern, entry.key)) {
                    result.objects.push_back(descriptor_from(entry));
                }
            }
            if (result.objects.empty()) {
                result.error = CatError::no_match();
                return;
            }
            sort_by_key(result.objects);
            result.success = true;
        }
    }, kind);

    log_debug("resolved \"%s\" to %zu object(s) with %u list request(s)",
              target.path_spec.c_str(), result.objects.size(), result.list_requests);
    return result;
}

} // namespace objcat
