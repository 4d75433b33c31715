#include "shared.hpp"

#include <glfwire/core/Log.hpp>
#include <glfwire/core/Scope.hpp>

#include "../src/core/callback/CallbackRegistry.hpp"
#include "../src/core/callback/Registration.hpp"
#include "../src/core/callback/Signatures.hpp"
#include "../src/core/callback/Trampoline.hpp"

#include <stdexcept>
#include <string>
#include <vector>

using namespace Glfwire;

static std::vector<std::string> faults;

using Doubler = SCallbackSignature<Types::SWithDefault<Types::Int, -7>, Types::Int>;
using Checker = SCallbackSignature<Types::SWithDefault<Types::Bool, false>, Types::Window, Types::Mods>;

static void testCalls() {
    CScope scope;

    std::string lastChar;
    auto        charTrampoline = Callbacks::make<Signatures::Char>(GW_CALLBACK_CHAR, [&](SWindow*, std::string c) { lastChar = c; }, scope);

    EXPECT(charTrampoline->kind() == "char");
    EXPECT(charTrampoline->valid());
    EXPECT(!charTrampoline->foreign());

    rc<void (*)(void*, uint32_t)>(charTrampoline->codePointer())(nullptr, 0x20AC);
    EXPECT(lastChar == "\xE2\x82\xAC");

    std::optional<eKey>       lastKey;
    std::optional<eKeyAction> lastAction;
    std::set<eModifier>       lastMods;
    int32_t                   lastScancode = 0;

    auto                      keyTrampoline = Callbacks::make<Signatures::Key>(
        GW_CALLBACK_KEY,
        [&](SWindow*, std::optional<eKey> key, int32_t scancode, std::optional<eKeyAction> action, std::set<eModifier> mods) {
            lastKey      = key;
            lastScancode = scancode;
            lastAction   = action;
            lastMods     = mods;
        },
        scope);

    rc<void (*)(void*, int, int, int, int)>(keyTrampoline->codePointer())(nullptr, 65, 30, 1, 0x3);
    EXPECT(lastKey == std::optional{GW_KEY_A});
    EXPECT(lastScancode == 30);
    EXPECT(lastAction == std::optional{GW_PRESS});
    EXPECT(lastMods == (std::set<eModifier>{GW_MOD_SHIFT, GW_MOD_CONTROL}));

    // a key the binding does not know still reaches the callback
    rc<void (*)(void*, int, int, int, int)>(keyTrampoline->codePointer())(nullptr, 4242, 0, 2, 0);
    EXPECT(lastKey == std::nullopt);
    EXPECT(lastAction == std::optional{GW_REPEAT});
    EXPECT(lastMods.empty());

    auto doubler = Callbacks::make<Doubler>(GW_CALLBACK_CUSTOM, [](int32_t v) { return v * 2; }, scope);
    EXPECT(rc<int (*)(int)>(doubler->codePointer())(21) == 42);
    EXPECT(rc<int (*)(int)>(doubler->codePointer())(-4) == -8);

    std::vector<std::string> dropped;
    auto                     dropTrampoline =
        Callbacks::make<Signatures::Drop>(GW_CALLBACK_DROP, [&](SWindow*, std::vector<std::string> paths) { dropped = std::move(paths); }, scope);

    const char* PATHS[] = {"/tmp/a.png", "/tmp/b c.txt"};
    rc<void (*)(void*, int, const char**)>(dropTrampoline->codePointer())(nullptr, 2, PATHS);
    EXPECT(dropped.size() == 2);
    EXPECT(dropped.size() == 2 && dropped[1] == "/tmp/b c.txt");

    EXPECT(scope.size() == 4);
}

static void testFaults() {
    CScope scope;
    faults.clear();

    auto thrower = Callbacks::make<Doubler>(GW_CALLBACK_CUSTOM, [](int32_t) -> int32_t { throw std::runtime_error("boom"); }, scope);
    EXPECT(rc<int (*)(int)>(thrower->codePointer())(21) == -7);

    auto checker = Callbacks::make<Checker>(GW_CALLBACK_CUSTOM, [](SWindow*, std::set<eModifier>) -> bool { throw 5; }, scope);
    EXPECT(rc<int (*)(void*, int)>(checker->codePointer())(nullptr, 0) == 0);

    auto sizeThrower = Callbacks::make<Signatures::WindowSize>(GW_CALLBACK_WINDOW_SIZE, [](SWindow*, int32_t, int32_t) { throw std::logic_error("bad size"); }, scope);
    rc<void (*)(void*, int, int)>(sizeThrower->codePointer())(nullptr, 1, 2);

    EXPECT(faults.size() == 3);
    if (faults.size() == 3) {
        EXPECT(faults[0] == "callback custom threw: boom");
        EXPECT(faults[1] == "callback custom threw: unknown exception");
        EXPECT(faults[2] == "callback window-size threw: bad size");
    }

    // a log handler that throws is contained too
    setLogHandler([](eLogLevel, const std::string&) { throw std::runtime_error("handler"); });
    EXPECT(rc<int (*)(int)>(thrower->codePointer())(1) == -7);
    setLogHandler([](eLogLevel level, const std::string& message) {
        if (level == ERR)
            faults.emplace_back(message);
    });
}

static void testScopes() {
    UP<CScope> scope = makeUnique<CScope>();

    auto   trampoline = Callbacks::make<Signatures::WindowClose>(GW_CALLBACK_WINDOW_CLOSE, [](SWindow*) { ; }, *scope);
    int    object     = 0;

    callbacks().set(GW_CALLBACK_WINDOW_CLOSE, &object, trampoline);
    EXPECT(callbacks().get(GW_CALLBACK_WINDOW_CLOSE, &object) == trampoline);

    scope->close();
    EXPECT(scope->closed());
    EXPECT(scope->size() == 0);
    EXPECT(!trampoline->valid());
    EXPECT(trampoline->codePointer() == nullptr);
    EXPECT(!callbacks().get(GW_CALLBACK_WINDOW_CLOSE, &object));

    EXPECT_THROW(Callbacks::make<Signatures::WindowClose>(GW_CALLBACK_WINDOW_CLOSE, [](SWindow*) { ; }, *scope), std::logic_error);

    // closing twice is harmless
    scope->close();
    scope.reset();

    EXPECT_THROW(CScope::global().close(), std::logic_error);
    EXPECT(!CScope::global().closed());

    {
        CScope inner;
        auto   t = Callbacks::make<Signatures::Scroll>(GW_CALLBACK_SCROLL, [](SWindow*, double, double) { ; }, inner);
        EXPECT(t->valid());
        trampoline = t;
    }

    // scopes close when destroyed
    EXPECT(!trampoline->valid());
}

static void testSelfClosingScope() {
    faults.clear();

    WP<ITrampoline> weak;
    void*           code = nullptr;

    {
        CScope scope;

        {
            auto trampoline = Callbacks::make<Signatures::WindowClose>(
                GW_CALLBACK_WINDOW_CLOSE,
                [&scope, WHAT = std::string("closed its own scope")](SWindow*) {
                    scope.close();
                    throw std::runtime_error(WHAT);
                },
                scope);

            weak = trampoline;
            code = trampoline->codePointer();
        }

        // the scope is the only owner left
        rc<void (*)(void*)>(code)(nullptr);

        EXPECT(scope.closed());
        EXPECT(faults.size() == 1);
        EXPECT(faults.size() == 1 && faults[0] == "callback window-close threw: closed its own scope");

        // kept alive until nothing runs inside it
        EXPECT(!weak.expired());
        EXPECT(!weak->valid());
        EXPECT(CTrampolineBase::inFlight() == 0);
    }

    // the next close outside a callback frees it
    CScope other;
    other.close();
    EXPECT(weak.expired());
}

static void testRegistry() {
    CCallbackRegistry registry;
    CScope            scope;

    int               a = 0, b = 0;
    auto              first  = Callbacks::make<Signatures::Key>(GW_CALLBACK_KEY, [](SWindow*, std::optional<eKey>, int32_t, std::optional<eKeyAction>, std::set<eModifier>) { ; }, scope);
    auto              second = Callbacks::make<Signatures::Key>(GW_CALLBACK_KEY, [](SWindow*, std::optional<eKey>, int32_t, std::optional<eKeyAction>, std::set<eModifier>) { ; }, scope);
    auto              error  = Callbacks::make<Signatures::Error>(GW_CALLBACK_ERROR, [](std::optional<eErrorCode>, std::string) { ; }, scope);

    EXPECT(!registry.set(GW_CALLBACK_KEY, &a, first));
    EXPECT(registry.set(GW_CALLBACK_KEY, &a, second) == first);
    EXPECT(!registry.set(GW_CALLBACK_KEY, &b, first));
    EXPECT(!registry.set(GW_CALLBACK_ERROR, nullptr, error));
    EXPECT(registry.size() == 3);

    registry.dropObject(&a);
    EXPECT(!registry.get(GW_CALLBACK_KEY, &a));
    EXPECT(registry.get(GW_CALLBACK_KEY, &b) == first);

    registry.clearExcept(GW_CALLBACK_ERROR);
    EXPECT(registry.size() == 1);
    EXPECT(registry.get(GW_CALLBACK_ERROR, nullptr) == error);

    EXPECT(registry.set(GW_CALLBACK_ERROR, nullptr, nullptr) == error);
    EXPECT(registry.size() == 0);
}

int main() {
    setLogHandler([](eLogLevel level, const std::string& message) {
        if (level == ERR)
            faults.emplace_back(message);
    });

    testCalls();
    testFaults();
    testScopes();
    testSelfClosingScope();
    testRegistry();

    if (ret == 0)
        std::println("Trampoline: ok");

    return ret;
}
