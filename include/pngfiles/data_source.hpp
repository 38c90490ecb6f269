#pragma once

#include "pngfiles/format.hpp"

#include <cstddef>
#include <memory>
#include <utility>
#include <variant>

namespace pngfiles {

using SharedBytes = std::shared_ptr<const Bytes>;

// Payload storage for one chunk: either a [start, end) range into the buffer
// the container was parsed from, or a buffer owned by this chunk alone.
// The shared buffer is immutable; both forms expose the same read-only view.
class DataSource {
public:
    struct Borrowed {
        SharedBytes backing;
        std::size_t start;
        std::size_t end;
    };

    struct Owned {
        Bytes bytes;
    };

    // Throws OutOfBoundsError if the range does not lie inside backing.
    static DataSource Borrow(SharedBytes backing, std::size_t start, std::size_t end);
    static DataSource Own(Bytes bytes);

    ByteView View() const noexcept;
    std::size_t size() const noexcept { return View().size(); }
    bool IsBorrowed() const noexcept { return std::holds_alternative<Borrowed>(storage_); }

private:
    explicit DataSource(std::variant<Borrowed, Owned> storage) : storage_(std::move(storage)) {}

    std::variant<Borrowed, Owned> storage_;
};

}  // namespace pngfiles
