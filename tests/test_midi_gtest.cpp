// ==============================================================================
// test_midi_gtest.cpp - Тесты MIDI сообщений и декодера (GoogleTest)
// ==============================================================================

#include <cstdint>
#include <gtest/gtest.h>
#include <midimacro/midi.hpp>
#include <vector>

namespace midimacro::midi::test {

namespace {

std::vector<MidiMessage> decode(const std::vector<std::uint8_t>& bytes) {
    Decoder decoder;
    std::vector<MidiMessage> out;
    decoder.feed(bytes.data(), bytes.size(), out);
    return out;
}

}  // namespace

// ==============================================================================
// MessageKind
// ==============================================================================

TEST(MidiTest, MessageKind_RoundTripNames) {
    for (auto kind : {MessageKind::NoteOff, MessageKind::NoteOn, MessageKind::KeyPressure,
                      MessageKind::ControlChange, MessageKind::ProgramChange,
                      MessageKind::ChannelPressure, MessageKind::PitchBend}) {
        auto parsed = parse_message_kind(message_kind_to_string(kind));
        ASSERT_TRUE(parsed.has_value()) << message_kind_to_string(kind);
        EXPECT_EQ(*parsed, kind);
    }
    EXPECT_FALSE(parse_message_kind("sysex").has_value());
}

TEST(MidiTest, Describe_ControlChange) {
    EXPECT_EQ(describe(MidiMessage::control_change(0, 7, 40)),
              "control_change ch=0 control=7 value=40");
    EXPECT_EQ(describe(MidiMessage::program_change(3, 12)), "program_change ch=3 program=12");
}

TEST(MidiTest, ToValue_NamedFields) {
    Value v = to_value(MidiMessage::note_on(2, 60, 100));

    ASSERT_TRUE(v.is_object());
    EXPECT_EQ(v.get("message_type")->as_string(), "note_on");
    EXPECT_EQ(v.get("channel")->as_int(), 2);
    EXPECT_EQ(v.get("note")->as_int(), 60);
    EXPECT_EQ(v.get("velocity")->as_int(), 100);
    EXPECT_EQ(v.get("value"), nullptr);
}

// ==============================================================================
// Decoder
// ==============================================================================

TEST(DecoderTest, ControlChange) {
    auto msgs = decode({0xB0, 0x07, 0x28});
    ASSERT_EQ(msgs.size(), 1u);
    EXPECT_EQ(msgs[0], MidiMessage::control_change(0, 7, 40));
}

TEST(DecoderTest, RunningStatus) {
    auto msgs = decode({0x91, 0x3C, 0x40, 0x3E, 0x40, 0x3C, 0x00});
    ASSERT_EQ(msgs.size(), 3u);
    EXPECT_EQ(msgs[0], MidiMessage::note_on(1, 60, 64));
    EXPECT_EQ(msgs[1], MidiMessage::note_on(1, 62, 64));
    EXPECT_EQ(msgs[2], MidiMessage::note_on(1, 60, 0));
}

TEST(DecoderTest, ProgramChangeHasOneDataByte) {
    auto msgs = decode({0xC5, 0x0A, 0x0B});
    ASSERT_EQ(msgs.size(), 2u);
    EXPECT_EQ(msgs[0], MidiMessage::program_change(5, 10));
    EXPECT_EQ(msgs[1], MidiMessage::program_change(5, 11));
}

TEST(DecoderTest, PitchBendIsFourteenBit) {
    auto msgs = decode({0xE0, 0x00, 0x40, 0xE0, 0x7F, 0x7F});
    ASSERT_EQ(msgs.size(), 2u);
    EXPECT_EQ(msgs[0].primary, PITCH_BEND_CENTER);
    EXPECT_EQ(msgs[1].primary, 16383);
}

TEST(DecoderTest, RealTimeBytesInsideMessageAreIgnored) {
    auto msgs = decode({0xB0, 0xF8, 0x07, 0xFE, 0x28});
    ASSERT_EQ(msgs.size(), 1u);
    EXPECT_EQ(msgs[0], MidiMessage::control_change(0, 7, 40));
}

TEST(DecoderTest, SysExIsSkipped) {
    auto msgs = decode({0xF0, 0x7E, 0x7F, 0x06, 0x01, 0xF7, 0xB0, 0x01, 0x02});
    ASSERT_EQ(msgs.size(), 1u);
    EXPECT_EQ(msgs[0], MidiMessage::control_change(0, 1, 2));
}

TEST(DecoderTest, SystemCommonCancelsRunningStatus) {
    // Song select (0xF3) + 1 байт данных, затем данные без статуса
    auto msgs = decode({0xB0, 0x01, 0x02, 0xF3, 0x05, 0x03, 0x04});
    ASSERT_EQ(msgs.size(), 1u);
    EXPECT_EQ(msgs[0], MidiMessage::control_change(0, 1, 2));
}

TEST(DecoderTest, DataWithoutStatusIsDropped) {
    EXPECT_TRUE(decode({0x10, 0x20, 0x30}).empty());
}

TEST(DecoderTest, SplitAcrossFeeds) {
    Decoder decoder;
    EXPECT_FALSE(decoder.feed(0x90).has_value());
    EXPECT_FALSE(decoder.feed(0x40).has_value());
    auto msg = decoder.feed(0x7F);
    ASSERT_TRUE(msg.has_value());
    EXPECT_EQ(*msg, MidiMessage::note_on(0, 64, 127));

    decoder.reset();
    EXPECT_FALSE(decoder.feed(0x40).has_value());
}

}  // namespace midimacro::midi::test
