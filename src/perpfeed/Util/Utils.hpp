#pragma once

#include <stdexcept>

namespace Perpfeed
{

class PerpfeedError : public std::runtime_error
{
    using std::runtime_error::runtime_error;
};

// Unknown account or type name, malformed program interface description.
class SchemaError : public PerpfeedError
{
    using PerpfeedError::PerpfeedError;
};

// Short or invalid buffer for a known schema.
class DecodeError : public PerpfeedError
{
    using PerpfeedError::PerpfeedError;
};

// Bad magic, account type or size in an oracle price account.
class OracleFormatError : public PerpfeedError
{
    using PerpfeedError::PerpfeedError;
};

// Fatal, never recovered by per-instrument skips or fallback data.
class ConfigurationError : public PerpfeedError
{
    using PerpfeedError::PerpfeedError;
};

// Timeout, connection refused, proxy CONNECT rejected, TLS failure, RPC error.
class TransportError : public PerpfeedError
{
    using PerpfeedError::PerpfeedError;
};

// No custodies, or every instrument filtered out.
class EmptyResultError : public PerpfeedError
{
    using PerpfeedError::PerpfeedError;
};

} // namespace Perpfeed
