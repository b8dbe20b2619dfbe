#pragma once
#include <stdexcept>
#include <string>

// Upstream fetch or parse failure. Never retried here.
class ProviderError : public std::runtime_error
{
public:
    explicit ProviderError(std::string const& what) : std::runtime_error(what) {}
};

// Malformed font table. Fatal at startup.
class FontError : public std::runtime_error
{
public:
    explicit FontError(std::string const& what) : std::runtime_error(what) {}
};

// A character outside the loaded glyph set was requested.
class GlyphError : public std::out_of_range
{
public:
    explicit GlyphError(char c)
        : std::out_of_range(std::string("No glyph for character '") + c + "'")
        , character(c)
    {}

    char character;
};

class RenderInvariantError : public std::logic_error
{
public:
    explicit RenderInvariantError(std::string const& what) : std::logic_error(what) {}
};

// Interchange document does not have the expected shape.
class DocumentError : public std::runtime_error
{
public:
    explicit DocumentError(std::string const& what) : std::runtime_error(what) {}
};
