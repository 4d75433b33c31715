#pragma once

#include "EnumCodec.hpp"
#include "Enums.hpp"

/*
    Process-wide codec tables, built on first use and read-only afterwards.
*/
namespace Glfwire::Codecs {
    const CEnumCodec<eErrorCode>&          errorCodes();
    const CEnumCodec<eInitHint>&           initHints();
    const CEnumCodec<eWindowHint>&         windowHints();
    const CEnumCodec<eClientApi>&          clientApis();
    const CEnumCodec<eContextCreationApi>& contextCreationApis();
    const CEnumCodec<eContextRobustness>&  contextRobustness();
    const CEnumCodec<eReleaseBehavior>&    releaseBehaviors();
    const CEnumCodec<eOpenGLProfile>&      openGLProfiles();
    const CEnumCodec<eInputMode>&          inputModes();
    const CEnumCodec<eCursorMode>&         cursorModes();
    const CEnumCodec<eKey>&                keys();
    const CEnumCodec<eKeyAction>&          keyActions();
    const CEnumCodec<eMouseButton>&        mouseButtons();
    const CEnumCodec<eConnectionEvent>&    connectionEvents();
    const CEnumCodec<eStandardCursor>&     standardCursors();
    const CEnumCodec<eGamepadButton>&      gamepadButtons();

    const CBitflagCodec<eModifier>&        modifiers();
    const CBitflagCodec<eHat>&             hats();
};
