#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>
#include <pugixml.hpp>

namespace diagcollect::report {

// Which nodes of a report to keep. `node_path` names the tag level to walk
// ("/Root/Child/Leaf"); `selector_field` is a child element (or attribute)
// whose text is compared against `selector_value` ignoring case.
struct FilterQuery {
    std::string node_path;
    std::string selector_field;
    std::string selector_value;
    std::string output_root = "FilteredReport";
};

enum class FilterStatus {
    Matched,
    NoMatchingNodes,
    SourceNotFound,
    ParseFailed,
    WriteFailed
};

struct FilterOutcome {
    FilterStatus status = FilterStatus::SourceNotFound;
    std::size_t count = 0;
    std::string error;
};

std::string to_string(FilterStatus status);

class ReportFilter {
public:
    using SelectorPredicate = std::function<bool(const std::string& value)>;

    static SelectorPredicate equals_ignore_case(std::string expected);

    // Copies every node at `node_path` whose selector field satisfies
    // `predicate` under a fresh `output_root` element of `filtered`, in
    // document order. Returns the number of copied nodes.
    std::size_t extract_matching(const pugi::xml_document& document,
                                 const std::string& node_path,
                                 const std::string& selector_field,
                                 const SelectorPredicate& predicate,
                                 const std::string& output_root,
                                 pugi::xml_document& filtered) const;

    // Loads `source_path`, filters it with `query` and saves the result to
    // `output_path`. The output is written even when nothing matched.
    FilterOutcome extract_file(const std::filesystem::path& source_path,
                               const FilterQuery& query,
                               const std::filesystem::path& output_path) const;
};

}  // namespace diagcollect::report
