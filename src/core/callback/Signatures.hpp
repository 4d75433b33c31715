#pragma once

#include "Trampoline.hpp"

/*
    Native callback signatures, argument for argument.
*/
namespace Glfwire::Signatures {
    using Error    = SCallbackSignature<Types::Void, Types::ErrorCode, Types::String>;
    using Monitor  = SCallbackSignature<Types::Void, Types::Monitor, Types::ConnectionEvent>;
    using Joystick = SCallbackSignature<Types::Void, Types::Int, Types::ConnectionEvent>;

    using WindowPos          = SCallbackSignature<Types::Void, Types::Window, Types::Int, Types::Int>;
    using WindowSize         = SCallbackSignature<Types::Void, Types::Window, Types::Int, Types::Int>;
    using WindowClose        = SCallbackSignature<Types::Void, Types::Window>;
    using WindowRefresh      = SCallbackSignature<Types::Void, Types::Window>;
    using WindowFocus        = SCallbackSignature<Types::Void, Types::Window, Types::Bool>;
    using WindowIconify      = SCallbackSignature<Types::Void, Types::Window, Types::Bool>;
    using WindowMaximize     = SCallbackSignature<Types::Void, Types::Window, Types::Bool>;
    using FramebufferSize    = SCallbackSignature<Types::Void, Types::Window, Types::Int, Types::Int>;
    using WindowContentScale = SCallbackSignature<Types::Void, Types::Window, Types::Float, Types::Float>;

    using Key         = SCallbackSignature<Types::Void, Types::Window, Types::Key, Types::Int, Types::KeyAction, Types::Mods>;
    using Char        = SCallbackSignature<Types::Void, Types::Window, Types::Codepoint>;
    using CharMods    = SCallbackSignature<Types::Void, Types::Window, Types::Codepoint, Types::Mods>;
    using MouseButton = SCallbackSignature<Types::Void, Types::Window, Types::MouseButton, Types::KeyAction, Types::Mods>;
    using CursorPos   = SCallbackSignature<Types::Void, Types::Window, Types::Double, Types::Double>;
    using CursorEnter = SCallbackSignature<Types::Void, Types::Window, Types::Bool>;
    using Scroll      = SCallbackSignature<Types::Void, Types::Window, Types::Double, Types::Double>;
    using Drop        = SDropSignature;
};
