#pragma once

// Out-of-line definitions. Include from exactly one translation unit.

#include <rediswire/impl/assert.ipp>
#include <rediswire/impl/logger.ipp>
