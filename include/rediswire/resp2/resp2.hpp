#pragma once

/// Main header for RESP2 decoding
/// Include this file to get the value model, the one-shot decoder and the stream parser

#include <rediswire/resp2/type.hpp>
#include <rediswire/resp2/value.hpp>
#include <rediswire/resp2/message.hpp>
#include <rediswire/resp2/error.hpp>
#include <rediswire/resp2/decoder.hpp>
#include <rediswire/resp2/parser.hpp>
