#include <rediswire/src.hpp>
