#pragma once

#include <libchroma/Graphics/Color.h>
#include <libchroma/Graphics/ColorError.h>
#include <libchroma/Graphics/ColorHSL.h>
#include <libchroma/Graphics/ColorParsing.h>
#include <libchroma/Graphics/Palettes.h>
