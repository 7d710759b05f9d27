#ifndef NANBSTR_HPP
#define NANBSTR_HPP

#include "nanbstr/cbor/decoder.hpp"
#include "nanbstr/cbor/diagnostic.hpp"
#include "nanbstr/cbor/encoder.hpp"
#include "nanbstr/cbor/item.hpp"
#include "nanbstr/cbor/tags.hpp"
#include "nanbstr/core/bits.hpp"
#include "nanbstr/core/format.hpp"
#include "nanbstr/core/nan_bstr.hpp"
#include "nanbstr/core/native.hpp"
#include "nanbstr/core/status.hpp"
#include "nanbstr/core/width.hpp"

#endif // NANBSTR_HPP
