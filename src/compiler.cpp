#include "compiler.hpp"

#include "errors.hpp"
#include "utils.hpp"

#include <fmt/core.h>
#include <tao/pegtl.hpp>
#include <tao/pegtl/contrib/analyze.hpp>
#include <utf8.h>

#include <iterator>

#include <utility>
#include <vector>

namespace fsm_regex {

namespace pegtl = tao::pegtl;
namespace u8 = tao::pegtl::utf8;

namespace grammar {

struct quantifier : u8::one<U'*', U'+'>
{};

// `]` cannot be escaped, the body ends at the first one
struct class_body : pegtl::star<u8::not_one<U']'>>
{};

struct char_class : pegtl::if_must<u8::one<U'['>, class_body, u8::one<U']'>>
{};

struct wildcard : u8::one<U'.'>
{};

struct literal : u8::any
{};

struct atom : pegtl::sor<char_class, wildcard, literal>
{};

struct element : pegtl::sor<quantifier, atom>
{};

struct pattern : pegtl::seq<pegtl::plus<element>, pegtl::eof>
{};

} // namespace grammar

namespace {

class graph_builder
{
    sm::graph g;

    // one entry per top-level construct, not per character
    std::vector<stateid_t> constructs;

    auto last() const -> stateid_t { return constructs.empty() ? g.start_state : constructs.back(); }

public:
    graph_builder() { g.start_state = g.add_state(sm::start{}); }

    void append(sm::state_kind kind)
    {
        auto parent = last();
        auto id = g.add_state(std::move(kind));
        g.add_edge(parent, id);
        constructs.push_back(id);
    }

    // Replaces the most recent construct with a repeat state wrapping it.
    void quantify(char op)
    {
        if (constructs.empty()) {
            throw invalid_pattern(
                fmt::format("'{}' cannot be used without a preceding character", op));
        }

        auto prev = constructs.back();
        auto parent = constructs.size() >= 2 ? constructs[constructs.size() - 2] : g.start_state;

        auto id = g.add_state(sm::repeat{prev, op == '*' ? 0 : 1});
        g.remove_edge(parent, prev);
        g.add_edge(parent, id);
        g.add_edge(id, id);

        constructs.back() = id;
    }

    auto finish() && -> sm::graph
    {
        auto parent = last();
        g.termination_state = g.add_state(sm::termination{});
        g.add_edge(parent, g.termination_state);
        return std::move(g);
    }
};

template<typename Rule>
struct action : pegtl::nothing<Rule>
{};

template<>
struct action<grammar::quantifier>
{
    template<typename ActionInput>
    static void apply(ActionInput const& in, graph_builder& builder)
    {
        builder.quantify(in.peek_char());
    }
};

template<>
struct action<grammar::class_body>
{
    template<typename ActionInput>
    static void apply(ActionInput const& in, graph_builder& builder)
    {
        builder.append(parse_class_body(to_unicode(in.string_view())));
    }
};

template<>
struct action<grammar::wildcard>
{
    template<typename ActionInput>
    static void apply(ActionInput const&, graph_builder& builder)
    {
        builder.append(sm::wildcard{});
    }
};

template<>
struct action<grammar::literal>
{
    template<typename ActionInput>
    static void apply(ActionInput const& in, graph_builder& builder)
    {
        builder.append(sm::literal{to_unicode(in.string_view()).at(0)});
    }
};

} // namespace

auto build_graph(std::string_view pattern) -> sm::graph
{
    if (pattern.empty()) {
        throw invalid_pattern("empty pattern");
    }

    auto invalid = utf8::find_invalid(pattern.begin(), pattern.end());
    if (invalid != pattern.end()) {
        throw invalid_pattern(fmt::format("pattern is not valid UTF-8 at byte offset {}",
                                          std::distance(pattern.begin(), invalid)));
    }

    static const std::size_t issues = pegtl::analyze<grammar::pattern>();
    if (issues > 0) {
        throw std::runtime_error("Grammar has issues.");
    }

    pegtl::memory_input in(pattern.data(), pattern.data() + pattern.size(), "pattern");
    auto builder = graph_builder{};
    try {
        if (!pegtl::parse<grammar::pattern, action>(in, builder)) {
            throw invalid_pattern(fmt::format("cannot parse pattern '{}'", pattern));
        }
    } catch (pegtl::parse_error const&) {
        // the only mandatory rule is the closing bracket
        throw invalid_pattern(fmt::format("unclosed character class in '{}'", pattern));
    }

    return std::move(builder).finish();
}

} // namespace fsm_regex
