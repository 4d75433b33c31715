#pragma once

#include "core/Log.hpp"
#include "core/Scope.hpp"
#include "core/Trampoline.hpp"
#include "core/types/Codecs.hpp"
#include "core/types/EnumCodec.hpp"
#include "core/types/Enums.hpp"
#include "core/types/Types.hpp"
#include "core/Library.hpp"
#include "core/Window.hpp"
#include "core/Monitor.hpp"
#include "core/Input.hpp"
