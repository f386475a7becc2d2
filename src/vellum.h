#pragma once

#include "types.h"
#include "style.h"
#include "dom.h"
#include "renderer.h"
#include "platform.h"
#include "context.h"
#include "surface.h"
