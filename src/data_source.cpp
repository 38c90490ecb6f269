#include "pngfiles/data_source.hpp"

#include "pngfiles/errors.hpp"

#include <string>
#include <utility>

namespace pngfiles {

DataSource DataSource::Borrow(SharedBytes backing, std::size_t start, std::size_t end) {
    if (!backing || start > end || end > backing->size()) {
        throw OutOfBoundsError("Chunk range [" + std::to_string(start) + ", " + std::to_string(end)
                               + ") lies outside the backing buffer");
    }
    return DataSource(Borrowed{std::move(backing), start, end});
}

DataSource DataSource::Own(Bytes bytes) {
    return DataSource(Owned{std::move(bytes)});
}

ByteView DataSource::View() const noexcept {
    if (const auto* borrowed = std::get_if<Borrowed>(&storage_)) {
        return ByteView(borrowed->backing->data() + borrowed->start, borrowed->end - borrowed->start);
    }
    return ByteView(std::get<Owned>(storage_).bytes);
}

}  // namespace pngfiles
