#include "wirepod/codec/Codec.hpp"
#include "wirepod/codec/CustomCodec.hpp"
#include "wirepod/core/CodecConfig.hpp"
#include "wirepod/log/Log.hpp"
#include "wirepod/schema/Schema.hpp"

#include <cstdint>
#include <cstdlib>
#include <memory>
#include <vector>

using namespace wirepod;
using namespace wirepod::schema;
using wirepod::codec::Codec;
using wirepod::codec::Context;

static int g_failures = 0;

#define ASSERT_TRUE(cond, msg) \
    do { if (!(cond)) { wirepod::logError("ASSERT TRUE FAILED: ", (msg), \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

#define ASSERT_EQ(a,b,msg) \
    do { auto _va=(a); auto _vb=(b); if (!((_va)==(_vb))) { wirepod::logError("ASSERT EQ FAILED: ", (msg), \
        "  (", +_va, " != ", +_vb, ")" \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

using Bytes = std::vector<std::uint8_t>;

static Value u8(std::uint8_t v) { return Value::of(v); }
static Value u16(std::uint16_t v) { return Value::of(v); }
static Value u32(std::uint32_t v) { return Value::of(v); }

// One padding byte whose decoded value is the offset it was read at. The
// offset seen on encode is left in the "marker" context slot.
class PositionMarker final : public codec::CustomCodec {
public:
    std::string name() const override { return "PositionMarker"; }

    Result<std::size_t> size(const Value&) const override { return std::size_t{1}; }

    Result<Value> decode(codec::ReadCursor& in, Context& context, ByteOrder) const override {
        const std::size_t position = in.position();
        std::uint8_t pad = 0;
        if (auto ec = in.read(&pad, 1)) {
            return makeError(ec, "", "marker byte");
        }
        context.set("marker", Value::of<std::uint64_t>(position));
        return Value::of<std::uint64_t>(position);
    }

    Result<void> encode(const Value&, codec::WriteCursor& out, Context& context, ByteOrder) const override {
        context.set("marker", Value::of<std::uint64_t>(out.position()));
        const std::uint8_t pad = 0;
        if (auto ec = out.write(&pad, 1)) {
            return makeError(ec, "", "marker byte");
        }
        return {};
    }
};

static Codec compileOrDie(const Result<SchemaPtr>& built) {
    if (!built) {
        wirepod::logError("schema failed: ", built.error().describe(), "\n");
        std::exit(1);
    }
    auto codec = Codec::compile(*built);
    if (!codec) {
        wirepod::logError("compile failed: ", codec.error().describe(), "\n");
        std::exit(1);
    }
    return *codec;
}

static SchemaPtr scenarioSchema() {
    auto built = RecordBuilder("Scenario")
        .byteOrder(ByteOrder::Big)
        .field("a", Type::primitive(PrimitiveType::U16))
        .field("b", Type::sequence(Type::primitive(PrimitiveType::U8)), Metadata::sized(PrimitiveType::U32))
        .field("c", Type::primitive(PrimitiveType::U32))
        .build();
    return built ? *built : nullptr;
}

static void testConcreteScenario() {
    auto codec = compileOrDie(scenarioSchema());
    const Value value = Value::record({u16(1), Value::list({u8(1), u8(2), u8(3)}), u32(5)});
    const Bytes expected{0x00, 0x01, 0x00, 0x00, 0x00, 0x03, 0x01, 0x02, 0x03, 0x00, 0x00, 0x00, 0x05};

    auto size = codec.encodedSize(value);
    ASSERT_TRUE(size.has_value(), "size of scenario");
    if (size) ASSERT_EQ(*size, std::size_t{13}, "u16 + u32 prefix + 3 bytes + u32");

    auto bytes = codec.encodeToBuffer(value);
    ASSERT_TRUE(bytes.has_value(), "encode scenario");
    if (bytes) ASSERT_TRUE(*bytes == expected, "scenario byte layout");

    auto decoded = codec.decodeFromBuffer(ByteView(expected));
    ASSERT_TRUE(decoded.has_value(), "decode scenario");
    if (decoded) ASSERT_TRUE(*decoded == value, "scenario round trip");
    ASSERT_TRUE(codec.byteOrder() == ByteOrder::Big, "codec reports its byte order");
}

static void testTruncatedAndTrailing() {
    auto codec = compileOrDie(scenarioSchema());
    const Bytes truncated{0x00, 0x01, 0x00, 0x00, 0x00};
    auto decoded = codec.decodeFromBuffer(ByteView(truncated));
    ASSERT_TRUE(!decoded, "truncated input fails");
    if (!decoded) {
        ASSERT_TRUE(decoded.error().is(ErrorKind::IoFailure), "truncation is an I/O failure");
        ASSERT_TRUE(decoded.error().where == "Scenario.b", "failure located at the length prefix");
    }

    const Bytes padded{0x00, 0x01, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x09, 0xee, 0xff};
    MemoryInputStream stream{ByteView(padded)};
    auto value = codec.decode(stream);
    ASSERT_TRUE(value.has_value(), "trailing bytes are not an error");
    ASSERT_EQ(stream.consumed(), std::size_t{10}, "decode consumes exactly the encoded size");
    ASSERT_EQ(stream.remaining(), std::size_t{2}, "trailing bytes left unread");
}

static void testMagic() {
    auto codec = compileOrDie(RecordBuilder("Tagged")
        .byteOrder(ByteOrder::Big)
        .magic(PrimitiveType::U16, 0xabcd)
        .field("v", Type::primitive(PrimitiveType::U16))
        .build());
    const Value value = Value::record({u16(0x1234)});

    auto size = codec.encodedSize(value);
    if (size) ASSERT_EQ(*size, std::size_t{4}, "magic counted in size");
    auto bytes = codec.encodeToBuffer(value);
    ASSERT_TRUE(bytes && (*bytes == Bytes{0xab, 0xcd, 0x12, 0x34}), "magic emitted first");

    const Bytes wrong{0xab, 0xce, 0x12, 0x34};
    auto decoded = codec.decodeFromBuffer(ByteView(wrong));
    ASSERT_TRUE(!decoded, "mismatching magic rejected");
    if (!decoded) {
        ASSERT_TRUE(decoded.error().is(ErrorKind::BadMagic), "bad magic kind");
        ASSERT_TRUE(decoded.error().where == "Tagged.<magic>", "bad magic location");
    }

    auto trailer = compileOrDie(RecordBuilder("Trailer")
        .byteOrder(ByteOrder::Little)
        .field("v", Type::primitive(PrimitiveType::U8))
        .magic(PrimitiveType::U16, 0xbaba)
        .field("w", Type::primitive(PrimitiveType::U8))
        .build());
    auto mid = trailer.encodeToBuffer(Value::record({u8(1), u8(2)}));
    ASSERT_TRUE(mid && (*mid == Bytes{0x01, 0xba, 0xba, 0x02}), "magic placed before the next field");
}

static void testSkipped() {
    auto codec = compileOrDie(RecordBuilder("WithSkip")
        .byteOrder(ByteOrder::Big)
        .field("a", Type::primitive(PrimitiveType::U8))
        .skip("d", u32(7))
        .skip("e")
        .build());
    const Bytes wire{0x2a};
    auto decoded = codec.decodeFromBuffer(ByteView(wire));
    ASSERT_TRUE(decoded.has_value(), "decode with skipped fields");
    if (decoded) {
        ASSERT_EQ(decoded->size(), std::size_t{3}, "skipped fields appear in the value");
        ASSERT_TRUE((*decoded)[1] == u32(7), "skipped field takes its default");
        ASSERT_TRUE((*decoded)[2] == Value::unit(), "default default is unit");
    }
    auto bytes = codec.encodeToBuffer(Value::record({u8(0x2a), u32(99), Value::unit()}));
    ASSERT_TRUE(bytes && (*bytes == wire), "skipped fields are never written");
}

static void testFullRecord() {
    auto marker = std::make_shared<PositionMarker>();
    auto codec = compileOrDie(RecordBuilder("Struct1")
        .byteOrder(ByteOrder::Little)
        .magic(PrimitiveType::U16, 0xbaba)
        .field("a", Type::primitive(PrimitiveType::U16))
        .field("b", Type::sequence(Type::primitive(PrimitiveType::U8)), Metadata::sized(PrimitiveType::U32))
        .field("c", Type::primitive(PrimitiveType::U32))
        .skip("d")
        .field("e", Type::unit())
        .field("f", Type::tuple({Type::primitive(PrimitiveType::U16), Type::primitive(PrimitiveType::U32)}))
        .field("g", Type::fixedArray(Type::primitive(PrimitiveType::U16), 3))
        .skip("h", Value::of<std::int32_t>(0))
        .field("p", Type::custom(marker))
        .build());

    const Value value = Value::record({
        u16(1),
        Value::list({u8(1), u8(2), u8(3)}),
        u32(5),
        Value::unit(),
        Value::unit(),
        Value::list({u16(1), u32(2)}),
        Value::list({u16(1), u16(2), u16(3)}),
        Value::of<std::int32_t>(0),
        Value::of<std::uint64_t>(0),
    });
    const std::size_t expectedSize = 2 + 2 + 4 + 3 + 4 + (2 + 4) + 3 * 2 + 1;

    auto size = codec.encodedSize(value);
    ASSERT_TRUE(size.has_value(), "size of full record");
    if (size) ASSERT_EQ(*size, expectedSize, "full record size");

    Context encodeContext;
    auto bytes = codec.encodeToBuffer(value, encodeContext);
    ASSERT_TRUE(bytes.has_value(), "encode full record");
    if (!bytes) return;
    ASSERT_EQ(bytes->size(), expectedSize, "encode writes exactly the encoded size");
    const Value* seen = encodeContext.find("marker");
    ASSERT_TRUE(seen && *seen == Value::of<std::uint64_t>(expectedSize - 1), "marker saw its encode offset");

    auto decoded = codec.decodeFromBuffer(ByteView(*bytes));
    ASSERT_TRUE(decoded.has_value(), "decode full record");
    if (!decoded) return;
    for (std::size_t i = 0; i + 1 < value.size(); ++i) {
        ASSERT_TRUE((*decoded)[i] == value[i], "field survives the round trip");
    }
    ASSERT_TRUE((*decoded)[8] == Value::of<std::uint64_t>(expectedSize - 1), "marker decoded its offset");
}

static void testNestedByteOrder() {
    auto inner = RecordBuilder("Inner").field("v", Type::primitive(PrimitiveType::U16)).build();
    auto little = RecordBuilder("InnerLE")
        .byteOrder(ByteOrder::Little)
        .field("v", Type::primitive(PrimitiveType::U16))
        .build();
    ASSERT_TRUE(inner && little, "inner schemas build");
    if (!inner || !little) return;

    auto codec = compileOrDie(RecordBuilder("Outer")
        .byteOrder(ByteOrder::Big)
        .field("x", Type::composite(*inner))
        .field("y", Type::composite(*little))
        .field("z", Type::composite(*inner), Metadata::ordered(ByteOrder::Little))
        .build());
    const Value value = Value::record({
        Value::record({u16(0x0102)}),
        Value::record({u16(0x0102)}),
        Value::record({u16(0x0102)}),
    });
    auto bytes = codec.encodeToBuffer(value);
    ASSERT_TRUE(bytes && (*bytes == Bytes{0x01, 0x02, 0x02, 0x01, 0x02, 0x01}),
                "nested schemas inherit the order unless they or the field set one");
    if (bytes) {
        auto decoded = codec.decodeFromBuffer(ByteView(*bytes));
        ASSERT_TRUE(decoded && *decoded == value, "nested round trip");
    }
}

static void testDefaultByteOrder() {
    auto plain = RecordBuilder("Plain").field("v", Type::primitive(PrimitiveType::U16)).build();
    ASSERT_TRUE(plain.has_value(), "plain schema builds");
    if (!plain) return;

    Result<Codec> littleCodec = makeError(Errc::schema_error, "unset");
    {
        config::CodecConfig::ScopedByteOrder scoped(ByteOrder::Little);
        littleCodec = Codec::compile(*plain);
    }
    auto bigCodec = [&] {
        config::CodecConfig::ScopedByteOrder scoped(ByteOrder::Big);
        return Codec::compile(*plain);
    }();
    ASSERT_TRUE(littleCodec && bigCodec, "compiled under both defaults");
    if (!littleCodec || !bigCodec) return;

    ASSERT_TRUE(littleCodec->byteOrder() == ByteOrder::Little, "default order captured at compile");
    auto le = littleCodec->encodeToBuffer(Value::record({u16(0x0102)}));
    auto be = bigCodec->encodeToBuffer(Value::record({u16(0x0102)}));
    ASSERT_TRUE(le && (*le == Bytes{0x02, 0x01}), "little default");
    ASSERT_TRUE(be && (*be == Bytes{0x01, 0x02}), "big default");
    ASSERT_TRUE(config::CodecConfig::defaultByteOrder() == config::WIREPOD_DEFAULT_BYTE_ORDER,
                "scoped override restored");
}

static void testTupleElementPath() {
    auto codec = compileOrDie(RecordBuilder("Pair")
        .byteOrder(ByteOrder::Big)
        .field("t", Type::tuple({Type::primitive(PrimitiveType::U8), Type::primitive(PrimitiveType::U16)}))
        .build());

    auto ok = codec.encodeToBuffer(Value::record({Value::list({u8(1), u16(0x0203)})}));
    ASSERT_TRUE(ok && (*ok == Bytes{0x01, 0x02, 0x03}), "tuple elements in order");

    auto truncated = codec.decodeFromBuffer(ByteView(Bytes{0x01, 0x02}));
    ASSERT_TRUE(!truncated && truncated.error().where == "Pair.t.1", "short read located at the element");

    auto wrong = codec.encodeToBuffer(Value::record({Value::list({u8(1), u8(2)})}));
    ASSERT_TRUE(!wrong && wrong.error().is(ErrorKind::ValueMismatch), "element type mismatch");
    if (!wrong) {
        ASSERT_TRUE(wrong.error().where == "Pair.t.1", "mismatch located at the element");
    }
}

static void testValueMismatch() {
    auto codec = compileOrDie(scenarioSchema());

    auto shortRecord = codec.encodedSize(Value::record({u16(1)}));
    ASSERT_TRUE(!shortRecord && shortRecord.error().is(ErrorKind::ValueMismatch), "field count mismatch");

    auto wrongScalar = codec.encodeToBuffer(Value::record({u32(1), Value::list({}), u32(5)}));
    ASSERT_TRUE(!wrongScalar, "wrong scalar type rejected");
    if (!wrongScalar) {
        ASSERT_TRUE(wrongScalar.error().is(ErrorKind::ValueMismatch), "scalar mismatch kind");
        ASSERT_TRUE(wrongScalar.error().where == "Scenario.a", "scalar mismatch location");
    }

    auto notARecord = codec.encodedSize(u16(1));
    ASSERT_TRUE(!notARecord, "scalar where a record is expected");
}

int main() {
    testConcreteScenario();
    testTruncatedAndTrailing();
    testMagic();
    testSkipped();
    testFullRecord();
    testNestedByteOrder();
    testDefaultByteOrder();
    testTupleElementPath();
    testValueMismatch();

    if (g_failures) {
        wirepod::logError("Tests failed: ", g_failures, " failure(s)\n");
        return 1;
    }
    wirepod::logInfo("Record codec tests passed.\n");
    return 0;
}
