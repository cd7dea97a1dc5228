
#ifndef JSONSTREAM_JSONSTREAM_HPP
#define JSONSTREAM_JSONSTREAM_HPP

#include "core.hpp"
#include "io_string.hpp"
#include "token.hpp"
#include "number.hpp"
#include "tokenizer.hpp"
#include "stream.hpp"
#include "read.hpp"
#include "consumer.hpp"
#include "writer.hpp"
#include "marshal.hpp"

#endif
