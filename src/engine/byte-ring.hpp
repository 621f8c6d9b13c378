#pragma once
#include <algorithm>
#include <cstring>
#include <span>
#include <vector>

namespace engine {
// fifo over a fixed buffer, read and write are monotonic byte counters
struct ByteRing {
    std::vector<std::byte> data;
    size_t                 read  = 0;
    size_t                 write = 0;

    auto capacity() const -> size_t {
        return data.size();
    }

    auto level() const -> size_t {
        return write - read;
    }

    auto space() const -> size_t {
        return capacity() - level();
    }

    auto reset(const size_t capacity) -> void {
        data.assign(capacity, std::byte(0));
        read  = 0;
        write = 0;
    }

    // drops every unread byte
    auto clear() -> void {
        read = write;
    }

    // returns the number of bytes stored
    // with drop_oldest, unread bytes are discarded to make room instead of truncating src
    auto push(std::span<const std::byte> src, const bool drop_oldest) -> size_t {
        if(capacity() == 0 || src.empty()) {
            return 0;
        }
        if(drop_oldest) {
            if(src.size() > capacity()) {
                src = src.last(capacity());
            }
            if(src.size() > space()) {
                read += src.size() - space();
            }
        } else {
            src = src.first(std::min(src.size(), space()));
        }

        const auto index = write % capacity();
        const auto first = std::min(src.size(), capacity() - index);
        std::memcpy(data.data() + index, src.data(), first);
        std::memcpy(data.data(), src.data() + first, src.size() - first);
        write += src.size();
        return src.size();
    }

    auto pop(const std::span<std::byte> dst) -> size_t {
        const auto len = std::min(dst.size(), level());
        if(len == 0) {
            return 0;
        }
        const auto index = read % capacity();
        const auto first = std::min(len, capacity() - index);
        std::memcpy(dst.data(), data.data() + index, first);
        std::memcpy(dst.data() + first, data.data(), len - first);
        read += len;
        return len;
    }

    // moves unread bytes into dst, limited by its free space, without a temporary buffer
    auto move_to(ByteRing& dst, const size_t bytes) -> size_t {
        const auto len = std::min({bytes, level(), dst.space()});
        if(len == 0) {
            return 0;
        }
        const auto index = read % capacity();
        const auto first = std::min(len, capacity() - index);
        dst.push(std::span{data}.subspan(index, first), false);
        dst.push(std::span{data}.first(len - first), false);
        read += len;
        return len;
    }

    // makes room for add more bytes, keeping unread bytes in order
    auto grow(const size_t add) -> void {
        if(add <= space()) {
            return;
        }
        const auto used     = level();
        const auto need     = used + add;
        const auto capacity = std::max({this->capacity() * 2, need, need + need / 2});

        auto buffer = std::vector<std::byte>(capacity);
        pop(std::span{buffer}.first(used));
        data  = std::move(buffer);
        read  = 0;
        write = used;
    }
};
} // namespace engine
