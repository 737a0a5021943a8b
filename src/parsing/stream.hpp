#ifndef ARBOR_PARSING_STREAM_HPP
#define ARBOR_PARSING_STREAM_HPP

#include <optional>
#include <string>
#include <string_view>
#include <common.hpp>

namespace arbor::parsing {
#include "macros_open.hpp"

  // Assuming 8-bit code units (UTF-8).
  using Char = uint8_t;

  // A class is a (finite) "revertable stream" of `T` if...
  template <typename T>
  class IStream {
    interface(IStream);

  public:
    // It allows generating the next element (or empty if reached the end):
    virtual auto advance() -> std::optional<T> required;
    // It allows obtaining the current position:
    virtual auto position() const -> size_t required;
    // It allows reverting to a previous position (i.e. `0 <= i <= position()`):
    virtual auto revert(size_t i) -> void required;
  };

  // Simplest implementation of a character stream (wrapper around a `std::string`).
  class CharStream: public IStream<Char> {
  public:
    explicit CharStream(std::string string):
        _string(std::move(string)) {}

    auto advance() -> std::optional<Char> override {
      if (_position >= _string.size())
        return {};
      return static_cast<Char>(_string[_position++]);
    }
    auto position() const -> size_t override {
      return _position;
    }
    auto revert(size_t i) -> void override {
      assert(i <= _position), _position = i;
    }

    // Peeks the element `k` positions ahead without consuming anything.
    auto peek(size_t k = 0) const -> std::optional<Char> {
      if (_position + k >= _string.size())
        return {};
      return static_cast<Char>(_string[_position + k]);
    }

    auto string() const -> std::string_view {
      return _string;
    }
    auto slice(size_t start, size_t end) const -> std::string_view {
      assert(start <= end && end <= _string.size());
      return std::string_view(_string).substr(start, end - start);
    }

  private:
    std::string _string;  // Underlying string.
    size_t _position = 0; // Current position.
  };

#include "macros_close.hpp"
}

#endif // ARBOR_PARSING_STREAM_HPP
