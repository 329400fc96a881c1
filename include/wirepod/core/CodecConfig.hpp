#pragma once

#include "wirepod/core/ByteOrder.hpp"

#include <atomic>
#include <cstddef>

namespace wirepod::config {

/**
 * @brief Constants shared by the codec and its in-memory buffers.
 */
constexpr std::size_t WIREPOD_DEFAULT_BUFFER_RESERVE = 256;     // bytes reserved by a fresh ByteBuffer
constexpr std::size_t WIREPOD_DEFAULT_SEQUENCE_RESERVE = 1024;  // elements reserved before decoding a sequence
constexpr ByteOrder WIREPOD_DEFAULT_BYTE_ORDER = ByteOrder::Native;

/**
 * @brief Process-wide codec defaults.
 *
 * The byte order is read once per schema by Codec::compile when the schema
 * does not name one, so changing it never affects codecs already compiled.
 * The sequence reserve caps how many elements are pre-allocated from an
 * untrusted length prefix.
 */
class CodecConfig {
public:
    static void setDefaultByteOrder(ByteOrder order) {
        byteOrderStorage().store(order);
    }

    static ByteOrder defaultByteOrder() {
        return byteOrderStorage().load();
    }

    static void setSequenceReserveLimit(std::size_t elements) {
        reserveStorage().store(elements);
    }

    static std::size_t sequenceReserveLimit() {
        return reserveStorage().load();
    }

    /** RAII helper that temporarily overrides the default byte order. */
    class ScopedByteOrder {
    public:
        explicit ScopedByteOrder(ByteOrder order)
        : previous_(defaultByteOrder()) {
            setDefaultByteOrder(order);
        }

        ScopedByteOrder(const ScopedByteOrder&) = delete;
        ScopedByteOrder& operator=(const ScopedByteOrder&) = delete;

        ~ScopedByteOrder() {
            setDefaultByteOrder(previous_);
        }

    private:
        ByteOrder previous_;
    };

private:
    static std::atomic<ByteOrder>& byteOrderStorage() {
        static std::atomic<ByteOrder> order{WIREPOD_DEFAULT_BYTE_ORDER};
        return order;
    }

    static std::atomic<std::size_t>& reserveStorage() {
        static std::atomic<std::size_t> limit{WIREPOD_DEFAULT_SEQUENCE_RESERVE};
        return limit;
    }
};

} // namespace wirepod::config
