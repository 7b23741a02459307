#include "report/report_filter.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>
#include <utility>
#include <vector>

namespace diagcollect::report {

namespace {

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    return value;
}

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

std::vector<std::string> split_path(const std::string& node_path) {
    std::vector<std::string> segments;
    std::string current;
    for (const char c : node_path) {
        if (c == '/') {
            if (!current.empty()) {
                segments.push_back(std::move(current));
                current.clear();
            }
            continue;
        }
        current.push_back(c);
    }
    if (!current.empty()) {
        segments.push_back(std::move(current));
    }
    return segments;
}

// Nodes at the same depth, gathered parent by parent, come out in document order.
std::vector<pugi::xml_node> nodes_at(const pugi::xml_document& document,
                                     const std::string& node_path) {
    std::vector<pugi::xml_node> level{document};
    for (const auto& segment : split_path(node_path)) {
        std::vector<pugi::xml_node> next;
        for (const auto& parent : level) {
            for (const auto& child : parent.children(segment.c_str())) {
                next.push_back(child);
            }
        }
        level = std::move(next);
        if (level.empty()) {
            break;
        }
    }
    return level;
}

std::string selector_text(const pugi::xml_node& node, const std::string& field) {
    const auto element = node.child(field.c_str());
    if (element) {
        return trim(element.text().as_string());
    }
    const auto attribute = node.attribute(field.c_str());
    if (attribute) {
        return trim(attribute.as_string());
    }
    return "";
}

}  // namespace

std::string to_string(const FilterStatus status) {
    switch (status) {
        case FilterStatus::Matched:
            return "matched";
        case FilterStatus::NoMatchingNodes:
            return "no_matching_nodes";
        case FilterStatus::SourceNotFound:
            return "source_not_found";
        case FilterStatus::ParseFailed:
            return "parse_failed";
        case FilterStatus::WriteFailed:
            return "write_failed";
        default:
            return "unknown";
    }
}

ReportFilter::SelectorPredicate ReportFilter::equals_ignore_case(std::string expected) {
    return [wanted = lowercase(trim(expected))](const std::string& value) {
        return lowercase(value) == wanted;
    };
}

std::size_t ReportFilter::extract_matching(const pugi::xml_document& document,
                                           const std::string& node_path,
                                           const std::string& selector_field,
                                           const SelectorPredicate& predicate,
                                           const std::string& output_root,
                                           pugi::xml_document& filtered) const {
    filtered.reset();
    auto root = filtered.append_child(output_root.c_str());

    std::size_t count = 0;
    for (const auto& node : nodes_at(document, node_path)) {
        if (!predicate(selector_text(node, selector_field))) {
            continue;
        }
        root.append_copy(node);
        ++count;
    }
    return count;
}

FilterOutcome ReportFilter::extract_file(const std::filesystem::path& source_path,
                                         const FilterQuery& query,
                                         const std::filesystem::path& output_path) const {
    FilterOutcome outcome;

    std::error_code ec;
    if (!std::filesystem::is_regular_file(source_path, ec) || ec) {
        outcome.status = FilterStatus::SourceNotFound;
        outcome.error = "Report not found: " + source_path.string();
        return outcome;
    }

    pugi::xml_document document;
    const pugi::xml_parse_result parsed = document.load_file(source_path.c_str());
    if (!parsed) {
        outcome.status = FilterStatus::ParseFailed;
        outcome.error = std::string(parsed.description()) + " at offset " +
                        std::to_string(parsed.offset);
        return outcome;
    }

    pugi::xml_document filtered;
    outcome.count =
        extract_matching(document, query.node_path, query.selector_field,
                         equals_ignore_case(query.selector_value), query.output_root, filtered);

    if (!filtered.save_file(output_path.c_str(), "  ")) {
        outcome.status = FilterStatus::WriteFailed;
        outcome.error = "Unable to write filtered report: " + output_path.string();
        return outcome;
    }

    outcome.status = outcome.count == 0 ? FilterStatus::NoMatchingNodes : FilterStatus::Matched;
    return outcome;
}

}  // namespace diagcollect::report
