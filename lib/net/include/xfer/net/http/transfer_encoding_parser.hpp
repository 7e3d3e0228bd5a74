/*
Module Name:
- transfer_encoding_parser.hpp

Abstract:
- Lazy, zero-copy tokenizer for the Transfer-Encoding field value
  (RFC 7230 §3.3.1: 1#transfer-coding).
- Splits on commas, strips OWS, skips empty list elements, and classifies each token
  through classify(). Emitted names are views into the input.
- Single pass and forward only. Once next() returns nullopt it keeps returning nullopt;
  construct a fresh parser to read the value again.
- Multiple field lines must be joined by the caller first (see header_fields.hpp).
*/
#pragma once

// C++ Standard Library
#include <cstddef>
#include <iterator>
#include <optional>
#include <string_view>
#include <vector>

// GSL
#include <gsl/gsl>

// Project
#include <xfer/net/http/transfer_coding.hpp>

namespace xfer::net::http
{

    class transfer_encoding_parser
    {
    public:
        class iterator;

        explicit constexpr transfer_encoding_parser(std::string_view value) noexcept :
            value_{ value }
        {
        }

        // Next classified token in header order, or nullopt once the value is used up.
        [[nodiscard]] std::optional<transfer_encoding> next() noexcept;

        [[nodiscard]] constexpr bool exhausted() const noexcept
        {
            return pos_ >= value_.size();
        }
        // Byte offset of the first unread character.
        [[nodiscard]] constexpr std::size_t position() const noexcept
        {
            return pos_;
        }
        [[nodiscard]] constexpr std::string_view input() const noexcept
        {
            return value_;
        }

        // Range access drains this parser; iteration resumes from the current cursor.
        [[nodiscard]] iterator begin() noexcept;
        [[nodiscard]] iterator end() noexcept;

    private:
        std::string_view value_;
        std::size_t pos_ = 0;
    };

    // Input iterator over a parser. Default-constructed value is the end iterator.
    class transfer_encoding_parser::iterator
    {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = transfer_encoding;
        using difference_type = std::ptrdiff_t;
        using pointer = const transfer_encoding*;
        using reference = const transfer_encoding&;

        iterator() noexcept = default;

        explicit iterator(transfer_encoding_parser& parser) noexcept :
            parser_{ &parser }, current_{ parser.next() }
        {
        }

        reference operator*() const noexcept
        {
            Expects(current_.has_value()); // deref after end
            return *current_;
        }

        pointer operator->() const noexcept
        {
            Expects(current_.has_value());
            return &*current_;
        }

        iterator& operator++() noexcept
        {
            current_ = parser_ ? parser_->next() : std::nullopt;
            return *this;
        }

        void operator++(int) noexcept
        {
            ++*this;
        }

        friend bool operator==(const iterator& a, const iterator& b) noexcept
        {
            return a.current_.has_value() == b.current_.has_value();
        }

    private:
        transfer_encoding_parser* parser_ = nullptr;
        std::optional<transfer_encoding> current_;
    };

    inline transfer_encoding_parser::iterator transfer_encoding_parser::begin() noexcept
    {
        return iterator{ *this };
    }

    inline transfer_encoding_parser::iterator transfer_encoding_parser::end() noexcept
    {
        return {};
    }

    [[nodiscard]] constexpr transfer_encoding_parser transfer_encodings(std::string_view value) noexcept
    {
        return transfer_encoding_parser{ value };
    }

    // Append every token of value to out, in header order.
    void collect(std::string_view value, std::vector<transfer_encoding>& out);

    // Every token of value, in header order.
    [[nodiscard]] std::vector<transfer_encoding> collect(std::string_view value);

    // Every token of value in the order a recipient removes them: the last-applied
    // coding (rightmost in the header) first.
    [[nodiscard]] std::vector<transfer_encoding> decode_order(std::string_view value);

} // namespace xfer::net::http
