#pragma once

#include "perpfeed/Anchor/IdlTypes.hpp"

#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace Perpfeed
{
namespace Anchor
{

// snake_case, PascalCase and kebab-case names to camelCase.
std::string to_camel_case( std::string_view name );

// First 8 bytes of sha256( "account:<declared name>" ).
Discriminator account_discriminator( std::string_view declaredAccountName );

// Immutable schema of every account and type exposed by one program.
class LayoutRegistry
{
public:
    LayoutRegistry( std::string programName, std::vector< IdlTypeDef > types, std::vector< IdlAccountDef > accounts );

    // Throws SchemaError on unknown names.
    const IdlTypeDef & type( std::string_view name ) const &;
    const IdlAccountDef & account( std::string_view name ) const &;

    bool has_type( std::string_view name ) const;
    bool has_account( std::string_view name ) const;

    // Returns nullptr when no account carries the data's discriminator prefix.
    const IdlAccountDef * find_account( std::span< const std::byte > data ) const &;

    const std::vector< IdlAccountDef > & accounts( ) const & { return _accounts; }
    const std::string & program_name( ) const & { return _programName; }

private:
    std::string _programName;
    std::unordered_map< std::string, IdlTypeDef > _types;
    std::vector< IdlAccountDef > _accounts;
};

// Builds the registry from a raw program interface description (Anchor IDL json).
// All type, field, variant and account names are normalized to camelCase.
// Throws SchemaError on malformed descriptions and unresolved type references.
LayoutRegistry build_registry( std::string_view idlJson );

// Reads and builds the registry from a file.
LayoutRegistry load_registry( const std::filesystem::path & idlPath );

} // namespace Anchor
} // namespace Perpfeed
