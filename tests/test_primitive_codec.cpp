#include "wirepod/codec/PrimitiveCodec.hpp"
#include "wirepod/core/ByteBuffer.hpp"
#include "wirepod/core/Stream.hpp"
#include "wirepod/log/Log.hpp"

#include <cstdint>
#include <vector>

using namespace wirepod;
using namespace wirepod::codec;
using schema::PrimitiveType;
using schema::Scalar;

static int g_failures = 0;

#define ASSERT_TRUE(cond, msg) \
    do { if (!(cond)) { wirepod::logError("ASSERT TRUE FAILED: ", (msg), \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

#define ASSERT_EQ(a,b,msg) \
    do { auto _va=(a); auto _vb=(b); if (!((_va)==(_vb))) { wirepod::logError("ASSERT EQ FAILED: ", (msg), \
        "  (", +_va, " != ", +_vb, ")" \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

static std::vector<std::uint8_t> writeOne(PrimitiveType type, const Scalar& value, ByteOrder order) {
    ByteBuffer buffer;
    BufferOutputStream stream(buffer);
    WriteCursor cursor(stream);
    auto ok = writePrimitive(cursor, type, value, order, "value");
    ASSERT_TRUE(ok.has_value(), "writePrimitive succeeds");
    ASSERT_EQ(cursor.position(), schema::primitiveSize(type), "cursor advanced by the primitive width");
    return buffer.release();
}

static Scalar readOne(PrimitiveType type, const std::vector<std::uint8_t>& bytes, ByteOrder order) {
    MemoryInputStream stream{ByteView(bytes)};
    ReadCursor cursor(stream);
    auto value = readPrimitive(cursor, type, order, "value");
    ASSERT_TRUE(value.has_value(), "readPrimitive succeeds");
    return value ? *value : Scalar(false);
}

static void testByteOrder() {
    auto be = writeOne(PrimitiveType::U32, Scalar(std::uint32_t{0x01020304}), ByteOrder::Big);
    ASSERT_TRUE((be == std::vector<std::uint8_t>{0x01, 0x02, 0x03, 0x04}), "u32 big endian layout");

    auto le = writeOne(PrimitiveType::U32, Scalar(std::uint32_t{0x01020304}), ByteOrder::Little);
    ASSERT_TRUE((le == std::vector<std::uint8_t>{0x04, 0x03, 0x02, 0x01}), "u32 little endian layout");

    auto native = writeOne(PrimitiveType::U16, Scalar(std::uint16_t{0xabcd}), ByteOrder::Native);
    auto expected = hostIsLittleEndian() ? std::vector<std::uint8_t>{0xcd, 0xab}
                                         : std::vector<std::uint8_t>{0xab, 0xcd};
    ASSERT_TRUE(native == expected, "native order follows the host");

    auto single = writeOne(PrimitiveType::U8, Scalar(std::uint8_t{0x7f}), ByteOrder::Big);
    ASSERT_TRUE((single == std::vector<std::uint8_t>{0x7f}), "single byte ignores order");

    ASSERT_TRUE(readOne(PrimitiveType::U16, {0x00, 0x01}, ByteOrder::Big) == Scalar(std::uint16_t{1}),
                "u16 big endian decode");
    ASSERT_TRUE(readOne(PrimitiveType::U16, {0x00, 0x01}, ByteOrder::Little) == Scalar(std::uint16_t{0x0100}),
                "u16 little endian decode");
}

static void testSignedAndWide() {
    auto minusOne = writeOne(PrimitiveType::I16, Scalar(std::int16_t{-2}), ByteOrder::Big);
    ASSERT_TRUE((minusOne == std::vector<std::uint8_t>{0xff, 0xfe}), "i16 two's complement");
    ASSERT_TRUE(readOne(PrimitiveType::I16, minusOne, ByteOrder::Big) == Scalar(std::int16_t{-2}),
                "i16 decode restores sign");

    ASSERT_TRUE(readOne(PrimitiveType::I8, {0x80}, ByteOrder::Little) == Scalar(std::int8_t{-128}),
                "i8 minimum");

    schema::UInt128 wide{0x0102030405060708ull, 0x090a0b0c0d0e0f10ull};
    auto beWide = writeOne(PrimitiveType::U128, Scalar(wide), ByteOrder::Big);
    ASSERT_EQ(beWide.size(), std::size_t{16}, "u128 width");
    ASSERT_EQ(beWide.front(), std::uint8_t{0x01}, "u128 big endian starts with high byte");
    ASSERT_EQ(beWide.back(), std::uint8_t{0x10}, "u128 big endian ends with low byte");
    ASSERT_TRUE(readOne(PrimitiveType::U128, beWide, ByteOrder::Big) == Scalar(wide), "u128 decode");

    auto leWide = writeOne(PrimitiveType::U128, Scalar(wide), ByteOrder::Little);
    ASSERT_EQ(leWide.front(), std::uint8_t{0x10}, "u128 little endian starts with low byte");

    schema::Int128 negative{~0ull, ~0ull};
    auto allOnes = writeOne(PrimitiveType::I128, Scalar(negative), ByteOrder::Little);
    ASSERT_TRUE(allOnes == std::vector<std::uint8_t>(16, 0xff), "i128 -1 is all ones");
}

static void testFloats() {
    auto f = writeOne(PrimitiveType::F32, Scalar(1.0f), ByteOrder::Big);
    ASSERT_TRUE((f == std::vector<std::uint8_t>{0x3f, 0x80, 0x00, 0x00}), "f32 1.0 big endian");
    ASSERT_TRUE(readOne(PrimitiveType::F32, f, ByteOrder::Big) == Scalar(1.0f), "f32 decode");

    auto d = writeOne(PrimitiveType::F64, Scalar(-2.5), ByteOrder::Little);
    ASSERT_EQ(d.back(), std::uint8_t{0xc0}, "f64 sign byte last in little endian");
    ASSERT_TRUE(readOne(PrimitiveType::F64, d, ByteOrder::Little) == Scalar(-2.5), "f64 decode");
}

static void testBool() {
    ASSERT_TRUE(readOne(PrimitiveType::Bool, {0x02}, ByteOrder::Big) == Scalar(true), "any non-zero byte is true");
    ASSERT_TRUE(readOne(PrimitiveType::Bool, {0x00}, ByteOrder::Big) == Scalar(false), "zero byte is false");
    auto t = writeOne(PrimitiveType::Bool, Scalar(true), ByteOrder::Big);
    ASSERT_TRUE((t == std::vector<std::uint8_t>{0x01}), "true encodes as 1");
}

static void testShortRead() {
    std::vector<std::uint8_t> bytes{0x01, 0x02, 0x03};
    MemoryInputStream stream{ByteView(bytes)};
    ReadCursor cursor(stream);
    auto value = readPrimitive(cursor, PrimitiveType::U32, ByteOrder::Big, "packet.length");
    ASSERT_TRUE(!value, "reading 4 bytes from 3 fails");
    if (!value) {
        ASSERT_TRUE(value.error().is(ErrorKind::IoFailure), "short read is an I/O failure");
        ASSERT_TRUE(value.error().code == Errc::end_of_stream, "short read reports end_of_stream");
        ASSERT_TRUE(value.error().where == "packet.length", "error carries the field path");
    }
    ASSERT_EQ(cursor.position(), std::size_t{0}, "failed read does not advance the cursor");
    ASSERT_EQ(stream.remaining(), std::size_t{3}, "failed read consumes nothing");
}

static void testWriteErrors() {
    ByteBuffer buffer;
    BufferOutputStream stream(buffer);
    WriteCursor cursor(stream);

    auto wrongType = writePrimitive(cursor, PrimitiveType::U16, Scalar(std::uint32_t{1}), ByteOrder::Big, "a");
    ASSERT_TRUE(!wrongType, "scalar of a different type is rejected");
    if (!wrongType) {
        ASSERT_TRUE(wrongType.error().is(ErrorKind::ValueMismatch), "type mismatch is value_mismatch");
    }

    auto overflow = writeBits(cursor, PrimitiveType::U8, 256, ByteOrder::Big, "len");
    ASSERT_TRUE(!overflow, "256 does not fit u8");
    if (!overflow) {
        ASSERT_TRUE(overflow.error().is(ErrorKind::LengthOverflow), "overflow kind");
    }

    auto negative = writeBits(cursor, PrimitiveType::I8, static_cast<std::uint64_t>(std::int64_t{-1}),
                              ByteOrder::Big, "tag");
    ASSERT_TRUE(negative.has_value(), "sign-extended -1 fits i8");
    ASSERT_EQ(buffer.size(), std::size_t{1}, "only the successful write reached the buffer");
    ASSERT_EQ(buffer.bytes()[0], std::uint8_t{0xff}, "-1 as i8");
}

static void testReadBits() {
    std::vector<std::uint8_t> bytes{0xff, 0xfe};
    MemoryInputStream stream{ByteView(bytes)};
    ReadCursor cursor(stream);
    auto bits = readBits(cursor, PrimitiveType::I16, ByteOrder::Big, "tag");
    ASSERT_TRUE(bits.has_value(), "readBits i16");
    if (bits) {
        ASSERT_EQ(static_cast<std::int64_t>(*bits), std::int64_t{-2}, "signed tag is sign-extended");
    }
}

static void testMemoryStreams() {
    ByteBuffer buffer(4);
    BufferOutputStream out(buffer);
    const std::uint8_t head[] = {0x10, 0x20, 0x30};
    ASSERT_TRUE(!out.writeAll(head, sizeof head), "buffer write succeeds");
    ASSERT_EQ(buffer.size(), std::size_t{3}, "bytes appended");

    MemoryInputStream in(buffer.view());
    std::uint8_t two[2] = {};
    ASSERT_TRUE(!in.readExact(two, 2), "read two of three");
    ASSERT_EQ(two[1], std::uint8_t{0x20}, "bytes read in order");
    ASSERT_TRUE(in.readExact(two, 2) == Errc::end_of_stream, "over-read reports end_of_stream");
    ASSERT_EQ(in.consumed(), std::size_t{2}, "over-read consumes nothing");

    buffer.clear();
    ASSERT_TRUE(buffer.view().empty(), "clear empties the buffer");
}

int main() {
    testByteOrder();
    testSignedAndWide();
    testFloats();
    testBool();
    testShortRead();
    testWriteErrors();
    testReadBits();
    testMemoryStreams();

    if (g_failures) {
        wirepod::logError("Tests failed: ", g_failures, " failure(s)\n");
        return 1;
    }
    wirepod::logInfo("Primitive codec tests passed.\n");
    return 0;
}
