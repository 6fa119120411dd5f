// core/json.cpp
//
// Copyright (C) 2025 The jyed authors
//
// This file is part of jyed.
//
// jyed is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// jyed is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with jyed.  If not, see <https://www.gnu.org/licenses/>.


#include "json.hpp"

#include <algorithm>
#include <limits>
#include <memory>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "log.hpp"

namespace jyed::core::json
{
    namespace detail
    {
        namespace
        {
            template<typename... Ts>
            struct overload : Ts ... { using Ts::operator()...; };

            constexpr std::size_t max_depth{ 512 };

            struct failure
            {
                std::string     message;
                std::size_t     offset;
            };

            [[nodiscard]] constexpr bool is_whitespace(const char c) noexcept
            {
                return c == ' ' or c == '\t' or c == '\n' or c == '\r';
            }

            [[nodiscard]] constexpr bool is_delimiter(const char c) noexcept
            {
                return is_whitespace(c) or c == ',' or c == ':' or c == ']' or c == '}';
            }

            /* "[json.exception.parse_error.101] parse error at line 1, column 2: syntax error ..." -> "syntax error ..."
             * the position is reported separately */
            [[nodiscard]] std::string error_text(std::string_view what)
            {
                if (const auto bracket{ what.find("] ") }; what.starts_with("[json.exception.") and bracket != std::string_view::npos)
                    what.remove_prefix(bracket + 2);

                if (what.starts_with("parse error"))
                {
                    if (const auto colon{ what.find(": ") }; colon != std::string_view::npos)
                        what.remove_prefix(colon + 2);
                }

                return std::string{ what };
            }

            [[nodiscard]] parse_error make_parse_error(std::string_view text, const failure& f)
            {
                parse_error result{ .message = f.message };
                const auto end{ std::min(f.offset, text.size()) };

                for (std::size_t i{ 0 }; i < end; ++i)
                {
                    if (text[i] == '\n')
                    {
                        ++result.line;
                        result.column = 1;
                    }
                    else
                    {
                        ++result.column;
                    }
                }

                return result;
            }

            /* Follows the parser's events through the source text to find where each value begins and ends.
             * Every token it is asked about has already been accepted by the parser. */
            class span_tracker
            {
            public:
                span_tracker(std::string_view text, const std::size_t pos) :
                        text_{ text }, pos_{ pos }
                {
                    /* the parser skips a byte order mark at the start of its input */
                    if (text_.substr(pos_, 3) == "\xef\xbb\xbf")
                        pos_ += 3;
                }

                [[nodiscard]] std::size_t position() const noexcept
                {
                    return pos_;
                }

                [[nodiscard]] char at(const std::size_t pos) const noexcept
                {
                    return pos < text_.size() ? text_[pos] : '\0';
                }

                /* '{' or '[', returns where it is */
                std::size_t open() noexcept
                {
                    const auto begin{ next_token() };
                    ++pos_;
                    return begin;
                }

                /* '}' or ']', returns the end of the container */
                std::size_t close() noexcept
                {
                    next_token();
                    ++pos_;
                    return pos_;
                }

                source_span string() noexcept
                {
                    const auto begin{ next_token() };

                    for (++pos_; pos_ < text_.size();)
                    {
                        const char c{ text_[pos_++] };

                        if (c == '\\')
                            ++pos_;
                        else if (c == '"')
                            break;
                    }

                    return { .begin = begin, .end = pos_ };
                }

                /* numbers and literals */
                source_span scalar() noexcept
                {
                    const auto begin{ next_token() };

                    while (pos_ < text_.size() and not is_delimiter(text_[pos_]))
                        ++pos_;

                    return { .begin = begin, .end = pos_ };
                }

            private:
                std::size_t next_token() noexcept
                {
                    while (pos_ < text_.size() and
                           (is_whitespace(text_[pos_]) or text_[pos_] == ',' or text_[pos_] == ':'))
                        ++pos_;

                    return pos_;
                }

                std::string_view    text_;
                std::size_t         pos_;
            };

            /* Builds nodes from the parser's events. With track_source set, every node records its span
             * and starts out unmodified. */
            class node_builder final : public nlohmann::json_sax<nlohmann::json>
            {
            public:
                node_builder(std::string_view text, const std::size_t offset, const bool track_source) :
                        tracker_{ text, offset }, offset_{ offset }, track_source_{ track_source }
                {
                }

                bool null() override
                {
                    return add(null_value{}, tracker_.scalar());
                }

                bool boolean(const bool val) override
                {
                    return add(val, tracker_.scalar());
                }

                bool number_integer(const number_integer_t val) override
                {
                    const auto span{ tracker_.scalar() };

                    /* -0 keeps its sign */
                    if (val == 0 and tracker_.at(span.begin) == '-')
                        return add(-0.0, span);

                    return add(std::int64_t{ val }, span);
                }

                bool number_unsigned(const number_unsigned_t val) override
                {
                    const auto span{ tracker_.scalar() };

                    if (val > static_cast<number_unsigned_t>(std::numeric_limits<std::int64_t>::max()))
                        return add(static_cast<double>(val), span);

                    return add(static_cast<std::int64_t>(val), span);
                }

                bool number_float(const number_float_t val, const string_t&) override
                {
                    return add(double{ val }, tracker_.scalar());
                }

                bool string(string_t& val) override
                {
                    return add(string_value{ .text = std::move(val) }, tracker_.string());
                }

                bool binary(binary_t&) override
                {
                    return fail("binary values are not JSON", tracker_.position());
                }

                bool start_object(std::size_t) override
                {
                    return open(value{ std::in_place_type<mapping> });
                }

                bool key(string_t& val) override
                {
                    static_cast<void>(tracker_.string());
                    stack_.back().key = std::move(val);
                    return true;
                }

                bool end_object() override
                {
                    return close();
                }

                bool start_array(std::size_t) override
                {
                    return open(value{ std::in_place_type<sequence> });
                }

                bool end_array() override
                {
                    return close();
                }

                bool parse_error(const std::size_t position, const std::string&,
                                 const nlohmann::json::exception& ex) override
                {
                    /* position counts the bytes read, including the one that was refused */
                    return fail(error_text(ex.what()), offset_ + (position > 0 ? position - 1 : 0));
                }

                [[nodiscard]] const std::optional<failure>& error() const noexcept
                {
                    return error_;
                }

                [[nodiscard]] std::optional<node>& result() noexcept
                {
                    return result_;
                }

            private:
                struct frame
                {
                    value           container;
                    std::size_t     begin;
                    std::string     key;
                };

                bool open(value container)
                {
                    const auto begin{ tracker_.open() };

                    if (stack_.size() > max_depth)
                        return fail("nesting too deep", begin);

                    stack_.push_back(frame{ .container = std::move(container), .begin = begin, .key = {} });
                    return true;
                }

                bool close()
                {
                    const auto end{ tracker_.close() };
                    auto f{ std::move(stack_.back()) };
                    stack_.pop_back();

                    return add(std::move(f.container), source_span{ .begin = f.begin, .end = end });
                }

                bool add(value v, const source_span span)
                {
                    node n{ track_source_ ? node{ std::move(v), span } : node{ std::move(v) } };

                    if (stack_.empty())
                    {
                        result_ = std::move(n);
                        return true;
                    }

                    auto& f{ stack_.back() };

                    if (auto* m{ std::get_if<mapping>(&f.container) })
                        m->push_back(mapping_entry{ .key = std::move(f.key), .child = std::move(n) });
                    else
                        std::get<sequence>(f.container).push_back(std::move(n));

                    return true;
                }

                bool fail(std::string message, const std::size_t offset)
                {
                    if (not error_.has_value())
                        error_ = failure{ .message = std::move(message), .offset = offset };

                    return false;
                }

                span_tracker            tracker_;
                std::size_t             offset_;
                bool                    track_source_;
                std::vector<frame>      stack_{};
                std::optional<node>     result_{};
                std::optional<failure>  error_{};
            };

            /* the single value in text[begin, end), surrounded by optional whitespace */
            [[nodiscard]] std::variant<node, failure> read_value(std::string_view text, const std::size_t begin,
                                                                 const std::size_t end, const bool track_source)
            {
                node_builder builder{ text, begin, track_source };
                const bool accepted{ nlohmann::json::sax_parse(text.data() + begin, text.data() + end, &builder) };

                if (accepted and builder.result().has_value())
                    return std::move(*builder.result());

                if (builder.error().has_value())
                    return *builder.error();

                throw std::runtime_error("json: parser stopped without a value or an error");
            }


            /* Writing */

            void write_string(std::string& out, std::string_view text)
            {
                /* invalid UTF-8 is written as U+FFFD */
                out += nlohmann::json(std::string{ text }).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
            }

            void write_scalar(std::string& out, const value& v)
            {
                std::visit(overload{
                        [&](const null_value&) { out += nlohmann::json(nullptr).dump(); },
                        [&](const bool b) { out += nlohmann::json(b).dump(); },
                        [&](const std::int64_t i) { out += nlohmann::json(i).dump(); },
                        [&](const double d) { out += format_floating(d); },
                        [&](const string_value& s) { write_string(out, s.text); },
                        /* JSON has no aliases */
                        [&](const alias_value& a) { write_string(out, "*" + a.anchor); },
                        [](const auto&) { throw std::invalid_argument("json: write_scalar called on a container"); }
                }, v);
            }

            class writer
            {
            public:
                writer(const std::string* source, const write_options& options) :
                        source_{ options.preserve_formatting ? source : nullptr }, options_{ options }
                {
                }

                void write_pretty(std::string& out, const node& n, const std::size_t depth) const
                {
                    if (passthrough(out, n))
                        return;

                    const auto* m{ std::get_if<mapping>(&n.get()) };
                    const auto* s{ std::get_if<sequence>(&n.get()) };

                    if (m)
                    {
                        if (m->empty())
                        {
                            out += "{}";
                            return;
                        }

                        out += "{\n";
                        for (std::size_t i{ 0 }; i < m->size(); ++i)
                        {
                            indent(out, depth + 1);
                            write_string(out, (*m)[i].key);
                            out += ": ";
                            write_pretty(out, (*m)[i].child, depth + 1);
                            out += i + 1 < m->size() ? ",\n" : "\n";
                        }
                        indent(out, depth);
                        out += '}';
                    }
                    else if (s)
                    {
                        if (s->empty())
                        {
                            out += "[]";
                            return;
                        }

                        out += "[\n";
                        for (std::size_t i{ 0 }; i < s->size(); ++i)
                        {
                            indent(out, depth + 1);
                            write_pretty(out, (*s)[i], depth + 1);
                            out += i + 1 < s->size() ? ",\n" : "\n";
                        }
                        indent(out, depth);
                        out += ']';
                    }
                    else if (const auto* docs{ std::get_if<documents>(&n.get()) })
                    {
                        /* JSON Lines: one compact document per line */
                        for (const auto& item : docs->items)
                        {
                            if (not passthrough(out, item))
                                write_compact(out, item);
                            out += '\n';
                        }
                    }
                    else
                    {
                        write_scalar(out, n.get());
                    }
                }

                static void write_compact(std::string& out, const node& n)
                {
                    std::visit(overload{
                            [&](const mapping& m) {
                                out += '{';
                                for (std::size_t i{ 0 }; i < m.size(); ++i)
                                {
                                    if (i > 0)
                                        out += ',';
                                    write_string(out, m[i].key);
                                    out += ':';
                                    write_compact(out, m[i].child);
                                }
                                out += '}';
                            },
                            [&](const sequence& s) {
                                out += '[';
                                for (std::size_t i{ 0 }; i < s.size(); ++i)
                                {
                                    if (i > 0)
                                        out += ',';
                                    write_compact(out, s[i]);
                                }
                                out += ']';
                            },
                            [&](const documents& d) {
                                for (const auto& item : d.items)
                                {
                                    write_compact(out, item);
                                    out += '\n';
                                }
                            },
                            [&](const auto&) { write_scalar(out, n.get()); }
                    }, n.get());
                }

            private:
                [[nodiscard]] bool passthrough(std::string& out, const node& n) const
                {
                    if (not source_ or n.modified() or not n.span().has_value())
                        return false;

                    const auto& span{ *n.span() };
                    if (span.end > source_->size() or span.begin > span.end)
                        return false;

                    out.append(*source_, span.begin, span.size());
                    return true;
                }

                void indent(std::string& out, const std::size_t depth) const
                {
                    out.append(depth * options_.indent_size, ' ');
                }

                const std::string*      source_;
                const write_options&    options_;
            };
        }
    }

    parse_result parse(std::string text)
    {
        auto source{ std::make_shared<const std::string>(std::move(text)) };
        auto result{ detail::read_value(*source, 0, source->size(), true) };

        if (const auto* f{ std::get_if<detail::failure>(&result) })
        {
            auto error{ detail::make_parse_error(*source, *f) };
            log::warn("json: parse error at {}:{}: {}", error.line, error.column, error.message);
            return error;
        }

        log::debug("json: read {} bytes", source->size());
        return tree{ std::get<node>(std::move(result)), std::move(source) };
    }

    parse_result parse_lines(std::string text)
    {
        auto source{ std::make_shared<const std::string>(std::move(text)) };
        const std::string_view view{ *source };
        std::vector<node> items{};

        for (std::size_t begin{ 0 }; begin < view.size();)
        {
            auto end{ view.find('\n', begin) };
            if (end == std::string_view::npos)
                end = view.size();

            /* blank lines separate nothing */
            const auto first{ view.find_first_not_of(" \t\r", begin) };

            if (first != std::string_view::npos and first < end)
            {
                auto result{ detail::read_value(view, begin, end, true) };

                if (const auto* f{ std::get_if<detail::failure>(&result) })
                {
                    /* errors past the end of a line belong to that line */
                    auto error{ detail::make_parse_error(view, detail::failure{ .message = f->message,
                                                                                .offset = std::min(f->offset, end) }) };
                    log::warn("json: parse error at {}:{}: {}", error.line, error.column, error.message);
                    return error;
                }

                items.push_back(std::get<node>(std::move(result)));
            }

            begin = end + 1;
        }

        log::debug("json: read {} documents", items.size());
        node root{ documents{ .items = std::move(items) }, source_span{ .begin = 0, .end = view.size() } };
        return tree{ std::move(root), std::move(source) };
    }

    literal_result parse_literal(std::string_view text)
    {
        auto result{ detail::read_value(text, 0, text.size(), false) };

        if (const auto* f{ std::get_if<detail::failure>(&result) })
            return detail::make_parse_error(text, *f);

        return std::get<node>(std::move(result));
    }

    std::string write(const tree& t, const write_options& options)
    {
        std::string result{};
        const detail::writer w{ t.source(), options };

        w.write_pretty(result, t.root(), 0);

        /* a documents root ends each line itself */
        if (not t.root().is_documents())
            result += '\n';

        return result;
    }

    std::string write_compact(const node& n)
    {
        std::string result{};
        detail::writer::write_compact(result, n);
        return result;
    }

    std::string quote(std::string_view text)
    {
        std::string result{};
        detail::write_string(result, text);
        return result;
    }
}
