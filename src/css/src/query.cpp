#include "scrape/css/query.hpp"
#include "scrape/css/matcher.hpp"
#include "scrape/core/logger.hpp"
#include "scrape/dom/navigation.hpp"
#include "scrape/dom/serializer.hpp"

namespace scrape::css {

using dom::NodeId;

namespace {

Logger& logger() {
    static Logger& instance = logging::get("css");
    return instance;
}

// Selectors that one index lookup answers: exactly `#id`, `.class` or `tag`
const std::vector<NodeId>* indexed_candidates(const dom::Document& doc, const SelectorList& list) {
    if (list.selectors.size() != 1) {
        return nullptr;
    }
    const auto& complex = list.selectors.front();
    if (complex.parts.size() != 1 || complex.leading_combinator) {
        return nullptr;
    }
    const auto& compound = complex.parts.front().compound;
    if (compound.selectors.size() != 1) {
        return nullptr;
    }

    const auto& simple = compound.selectors.front();
    if (const auto* id = std::get_if<IdSelector>(&simple)) {
        return &doc.elements_with_id(id->id);
    }
    if (const auto* cls = std::get_if<ClassSelector>(&simple)) {
        return &doc.elements_with_class(cls->class_name);
    }
    if (const auto* type = std::get_if<TypeSelector>(&simple)) {
        return &doc.elements_with_tag(type->tag_name);
    }
    return nullptr;
}

// Collects matches under `scope` (descendants only) or, without a scope, in
// the whole tree including the root.
void collect(const dom::Document& doc, std::optional<NodeId> scope,
             const CompiledSelector& selector, bool first_only, std::vector<NodeId>& out) {
    std::optional<NodeId> origin = scope ? scope : doc.root();
    if (!origin || !doc.contains(*origin)) {
        return;
    }

    SelectorMatcher matcher(doc);
    const auto& list = selector.selectors();

    if (doc.creation_order_is_document_order()) {
        if (const auto* candidates = indexed_candidates(doc, list)) {
            logger().trace_fmt("index lookup for '{}' ({} candidates)",
                               selector.source().view(), candidates->size());
            for (auto id : *candidates) {
                // Unattached or out-of-scope elements are skipped
                if (scope ? (id == *scope || !doc.is_inclusive_ancestor(*scope, id))
                          : !doc.is_inclusive_ancestor(*origin, id)) {
                    continue;
                }
                if (!matcher.matches(list, id)) {
                    continue;
                }
                out.push_back(id);
                if (first_only) {
                    return;
                }
            }
            return;
        }
    }

    if (!scope && matcher.matches(list, *origin)) {
        out.push_back(*origin);
        if (first_only) {
            return;
        }
    }

    for (auto id : dom::descendants(doc, *origin)) {
        if (matcher.matches(list, id)) {
            out.push_back(id);
            if (first_only) {
                return;
            }
        }
    }
}

std::optional<NodeId> first_match(const dom::Document& doc, std::optional<NodeId> scope,
                                  const CompiledSelector& selector) {
    std::vector<NodeId> found;
    collect(doc, scope, selector, true, found);
    if (found.empty()) {
        return std::nullopt;
    }
    return found.front();
}

std::vector<NodeId> all_matches(const dom::Document& doc, std::optional<NodeId> scope,
                                const CompiledSelector& selector) {
    std::vector<NodeId> found;
    collect(doc, scope, selector, false, found);
    return found;
}

std::vector<String> texts_of(const dom::Document& doc, const std::vector<NodeId>& ids) {
    std::vector<String> result;
    result.reserve(ids.size());
    for (auto id : ids) {
        result.push_back(dom::text(doc, id));
    }
    return result;
}

std::vector<std::optional<String>> attributes_of(const dom::Document& doc,
                                                 const std::vector<NodeId>& ids,
                                                 std::string_view attribute) {
    std::vector<std::optional<String>> result;
    result.reserve(ids.size());
    for (auto id : ids) {
        const auto* value = doc.node(id).attribute(attribute);
        result.push_back(value ? std::optional<String>(*value) : std::nullopt);
    }
    return result;
}

} // anonymous namespace

// ============================================================================
// String selectors
// ============================================================================

Result<std::optional<NodeId>, QueryError> find(const dom::Document& doc, std::string_view selector) {
    auto compiled = CompiledSelector::compile(selector);
    if (compiled.is_err()) {
        return make_error(std::move(compiled).error());
    }
    return find_compiled(doc, compiled.value());
}

Result<std::optional<NodeId>, QueryError> find_within(const dom::Document& doc, NodeId scope,
                                                      std::string_view selector) {
    auto compiled = CompiledSelector::compile(selector);
    if (compiled.is_err()) {
        return make_error(std::move(compiled).error());
    }
    return find_compiled_within(doc, scope, compiled.value());
}

Result<std::vector<NodeId>, QueryError> find_all(const dom::Document& doc, std::string_view selector) {
    auto compiled = CompiledSelector::compile(selector);
    if (compiled.is_err()) {
        return make_error(std::move(compiled).error());
    }
    return find_all_compiled(doc, compiled.value());
}

Result<std::vector<NodeId>, QueryError> find_all_within(const dom::Document& doc, NodeId scope,
                                                        std::string_view selector) {
    auto compiled = CompiledSelector::compile(selector);
    if (compiled.is_err()) {
        return make_error(std::move(compiled).error());
    }
    return find_all_compiled_within(doc, scope, compiled.value());
}

Result<std::vector<NodeId>, QueryError> select(const dom::Document& doc, std::string_view selector) {
    return find_all(doc, selector);
}

Result<std::vector<NodeId>, QueryError> select_within(const dom::Document& doc, NodeId scope,
                                                      std::string_view selector) {
    return find_all_within(doc, scope, selector);
}

// ============================================================================
// Compiled selectors
// ============================================================================

std::optional<NodeId> find_compiled(const dom::Document& doc, const CompiledSelector& selector) {
    return first_match(doc, std::nullopt, selector);
}

std::optional<NodeId> find_compiled_within(const dom::Document& doc, NodeId scope,
                                           const CompiledSelector& selector) {
    return first_match(doc, scope, selector);
}

std::vector<NodeId> find_all_compiled(const dom::Document& doc, const CompiledSelector& selector) {
    return all_matches(doc, std::nullopt, selector);
}

std::vector<NodeId> find_all_compiled_within(const dom::Document& doc, NodeId scope,
                                             const CompiledSelector& selector) {
    return all_matches(doc, scope, selector);
}

std::vector<NodeId> select_compiled(const dom::Document& doc, const CompiledSelector& selector) {
    return find_all_compiled(doc, selector);
}

std::vector<NodeId> select_compiled_within(const dom::Document& doc, NodeId scope,
                                           const CompiledSelector& selector) {
    return find_all_compiled_within(doc, scope, selector);
}

// ============================================================================
// Extraction
// ============================================================================

Result<std::vector<String>, QueryError> select_text(const dom::Document& doc, std::string_view selector) {
    auto matches = find_all(doc, selector);
    if (matches.is_err()) {
        return make_error(std::move(matches).error());
    }
    return texts_of(doc, matches.value());
}

Result<std::vector<String>, QueryError> select_text_within(const dom::Document& doc, NodeId scope,
                                                           std::string_view selector) {
    auto matches = find_all_within(doc, scope, selector);
    if (matches.is_err()) {
        return make_error(std::move(matches).error());
    }
    return texts_of(doc, matches.value());
}

Result<std::vector<std::optional<String>>, QueryError>
select_attr(const dom::Document& doc, std::string_view selector, std::string_view attribute) {
    auto matches = find_all(doc, selector);
    if (matches.is_err()) {
        return make_error(std::move(matches).error());
    }
    return attributes_of(doc, matches.value(), attribute);
}

Result<std::vector<std::optional<String>>, QueryError>
select_attr_within(const dom::Document& doc, NodeId scope,
                   std::string_view selector, std::string_view attribute) {
    auto matches = find_all_within(doc, scope, selector);
    if (matches.is_err()) {
        return make_error(std::move(matches).error());
    }
    return attributes_of(doc, matches.value(), attribute);
}

// ============================================================================
// closest
// ============================================================================

Result<std::optional<NodeId>, QueryError> closest(const dom::Document& doc, NodeId element,
                                                  std::string_view selector) {
    auto compiled = CompiledSelector::compile(selector);
    if (compiled.is_err()) {
        return make_error(std::move(compiled).error());
    }
    return closest_compiled(doc, element, compiled.value());
}

std::optional<NodeId> closest_compiled(const dom::Document& doc, NodeId element,
                                       const CompiledSelector& selector) {
    SelectorMatcher matcher(doc);
    for (auto ancestor : dom::ancestors(doc, element)) {
        if (matcher.matches(selector.selectors(), ancestor)) {
            return ancestor;
        }
    }
    return std::nullopt;
}

} // namespace scrape::css
