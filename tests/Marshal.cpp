#include "shared.hpp"

#include <cstddef>

#include "../src/core/marshal/Arena.hpp"
#include "../src/core/marshal/OutArgs.hpp"
#include "../src/core/marshal/StructLayout.hpp"
#include "../src/core/marshal/Structs.hpp"
#include "../src/core/types/Descriptors.hpp"

using namespace Glfwire;

static void testLayouts() {
    EXPECT(Layouts::vidmode().size() == 24);
    EXPECT(Layouts::vidmode().offsetOf("refreshRate") == 20);

    EXPECT(Layouts::image().offsetOf("pixels") == 8);
    EXPECT(Layouts::image().size() == 8 + sizeof(void*));

    // same shape as GLFWgammaramp, laid out by the compiler
    struct SRampRecord {
        unsigned short* red;
        unsigned short* green;
        unsigned short* blue;
        unsigned int    size;
    };

    EXPECT(Layouts::gammaRamp().offsetOf("size") == offsetof(SRampRecord, size));
    EXPECT(Layouts::gammaRamp().size() == sizeof(SRampRecord));
    EXPECT(Layouts::gammaRamp().alignment() == alignof(SRampRecord));

    EXPECT(Layouts::gamepadState().offsetOf("axes") == 16);
    EXPECT(Layouts::gamepadState().size() == 40);
    EXPECT(Layouts::gamepadState().field("buttons").count == GW_GAMEPAD_BUTTON_COUNT);
}

static void testArena() {
    const auto BASELINE = CArena::liveAllocations();

    {
        CArena arena;
        auto   ints = arena.allocate<int32_t>(16);
        EXPECT(ints[15] == 0);

        const auto STR = arena.string("hello");
        EXPECT(std::string_view{STR} == "hello");
        EXPECT(arena.blocks() == 2);
        EXPECT(CArena::liveAllocations() == BASELINE + 2);
    }

    EXPECT(CArena::liveAllocations() == BASELINE);

    const auto [x, y, name] = Marshal::withOutArgs<Types::Int, Types::Float, Types::CString>([](int32_t* outX, float* outY, const char** outName) {
        *outX    = 42;
        *outY    = 1.5F;
        *outName = "out";
    });

    EXPECT(x == 42);
    EXPECT(y == 1.5F);
    EXPECT(name == std::optional<std::string>{"out"});

    // an untouched out-arg reads as zero
    const auto [untouched] = Marshal::withOutArgs<Types::CString>([](const char**) { ; });
    EXPECT(untouched == std::nullopt);

    EXPECT(CArena::liveAllocations() == BASELINE);
}

static void testVideoModes() {
    const SVideoMode MODE{.width = 2560, .height = 1440, .redBits = 10, .greenBits = 10, .blueBits = 10, .refreshRate = 165};

    uint8_t          buffer[64] = {};
    Marshal::serializeInto(MODE, buffer);
    EXPECT(Marshal::deserializeFrom<SVideoMode>(buffer) == MODE);

    int32_t natives[12] = {1920, 1080, 8, 8, 8, 60, 800, 600, 5, 6, 5, 75};
    const auto MODES    = Marshal::deserializeArray(natives, 2);
    EXPECT(MODES.size() == 2);
    EXPECT(MODES[1].width == 800);
    EXPECT(MODES[1].greenBits == 6);
    EXPECT(MODES[1].refreshRate == 75);

    EXPECT(Marshal::deserializeArray(nullptr, 3).empty());
    EXPECT_THROW(Marshal::deserializeFrom<SVideoMode>(nullptr), std::invalid_argument);
}

static void testImages() {
    CArena arena;

    const SImage IMAGE{.width = 2, .height = 1, .pixels = {255, 0, 0, 255, 0, 255, 0, 128}};
    const auto   RECORD = Marshal::serialize(IMAGE, arena);
    EXPECT(Marshal::deserializeFrom<SImage>(RECORD) == IMAGE);

    EXPECT_THROW(Marshal::serialize(SImage{.width = 2, .height = 2, .pixels = {1, 2, 3}}, arena), std::invalid_argument);
    EXPECT_THROW(Marshal::serialize(SImage{.width = -1, .height = 1, .pixels = {}}, arena), std::invalid_argument);

    EXPECT(Marshal::serializeArray({}, arena) == nullptr);

    const auto ARRAY = rc<uint8_t*>(Marshal::serializeArray({IMAGE, SImage{.width = 1, .height = 1, .pixels = {9, 9, 9, 9}}}, arena));
    EXPECT(Marshal::deserializeFrom<SImage>(ARRAY + Layouts::image().size()).pixels[0] == 9);

    // a bad image anywhere in the list fails before anything is written
    const auto BEFORE = arena.blocks();
    EXPECT_THROW(Marshal::serializeArray({IMAGE, SImage{.width = 1, .height = 1, .pixels = {}}}, arena), std::invalid_argument);
    EXPECT(arena.blocks() == BEFORE);
}

static void testGammaRamps() {
    CArena           arena;

    const SGammaRamp RAMP{.red = {0, 100, 200, 65535}, .green = {0, 100, 200, 65535}, .blue = {0, 100, 200, 65535}};
    const auto       RECORD = Marshal::serialize(RAMP, arena);

    const auto&      L = Layouts::gammaRamp();
    EXPECT(L.read<uint32_t>(RECORD, "size") == 4);
    EXPECT(rc<const uint16_t*>(L.read<void*>(RECORD, "red"))[3] == 65535);

    const auto BACK = Marshal::deserializeFrom<SGammaRamp>(RECORD);
    EXPECT(BACK == RAMP);
    EXPECT(BACK.blue[3] == 65535);

    EXPECT_THROW(Marshal::serialize(SGammaRamp{}, arena), std::invalid_argument);
    EXPECT_THROW(Marshal::serialize(SGammaRamp{.red = {0, 1}, .green = {0}, .blue = {0}}, arena), std::invalid_argument);
    EXPECT_THROW(Marshal::serialize(SGammaRamp{.red = {70000}, .green = {0}, .blue = {0}}, arena), std::invalid_argument);
    EXPECT_THROW(Marshal::serialize(SGammaRamp{.red = {-1}, .green = {0}, .blue = {0}}, arena), std::invalid_argument);
}

static void testGamepadState() {
    SGamepadState state;
    state.buttons           = {GW_GAMEPAD_BUTTON_A, GW_GAMEPAD_BUTTON_DPAD_LEFT};
    state.axes.leftStick    = {-1.F, 0.5F};
    state.axes.rightTrigger = 1.F;

    uint8_t buffer[64] = {};
    Marshal::serializeInto(state, buffer);

    const auto& L = Layouts::gamepadState();
    EXPECT(L.read<uint8_t>(buffer, "buttons", GW_GAMEPAD_BUTTON_DPAD_LEFT) == GW_PRESS);
    EXPECT(L.read<uint8_t>(buffer, "buttons", GW_GAMEPAD_BUTTON_B) == GW_RELEASE);
    EXPECT(L.read<float>(buffer, "axes", 1) == 0.5F);
    EXPECT(L.read<float>(buffer, "axes", 5) == 1.F);

    EXPECT(Marshal::deserializeFrom<SGamepadState>(buffer) == state);
}

int main() {
    testLayouts();
    testArena();
    testVideoModes();
    testImages();
    testGammaRamps();
    testGamepadState();

    if (ret == 0)
        std::println("Marshal: ok");

    return ret;
}
