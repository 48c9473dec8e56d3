#pragma once

#include <libchroma/Platform/ChromaSettings.h>
#include <libchroma/Platform/Console.h>
#include <libchroma/Platform/Log.h>
#include <libchroma/Platform/LogLevel.h>
#include <libchroma/Platform/LogMessage.h>
#include <libchroma/Platform/LogSink.h>
#include <libchroma/Platform/Logger.h>
