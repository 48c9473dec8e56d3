#pragma once

#include <libchroma/Utils/CStringView.h>
#include <libchroma/Utils/EnumHelpers.h>
#include <libchroma/Utils/StringHelpers.h>
