#pragma once

#include <libchroma/Graphics.h>
#include <libchroma/Platform.h>
#include <libchroma/Shims.h>
#include <libchroma/Terminal.h>
#include <libchroma/Utils.h>
