#pragma once

#include <cstddef>
#include <iterator>
#include <optional>
#include <string>
#include <utility>

namespace sqlanon {

/**
 * @brief Single-pass input iterator over a pull-based line source
 *
 * Stream must expose `std::optional<std::string> next()`. Dereferencing
 * yields the last pulled line; incrementing pulls the next one, which is
 * when the stream does its work. Exceptions thrown by next() propagate out
 * of begin() / operator++.
 *
 *   for (const auto& line : anonymizator.anonymize()) { ... }
 */
template<typename Stream>
class LineIterator {
public:
    using iterator_category = std::input_iterator_tag;
    using value_type = std::string;
    using difference_type = std::ptrdiff_t;
    using pointer = const std::string*;
    using reference = const std::string&;

    LineIterator() = default;

    explicit LineIterator(Stream* stream) : stream_(stream) {
        pull();
    }

    reference operator*() const { return current_; }
    pointer operator->() const { return &current_; }

    LineIterator& operator++() {
        pull();
        return *this;
    }

    void operator++(int) { pull(); }

    friend bool operator==(const LineIterator& a, const LineIterator& b) {
        return a.stream_ == b.stream_;
    }

private:
    void pull() {
        if (!stream_) return;
        auto line = stream_->next();
        if (line) {
            current_ = std::move(*line);
        } else {
            stream_ = nullptr;
        }
    }

    Stream* stream_ = nullptr;
    std::string current_;
};

} // namespace sqlanon
