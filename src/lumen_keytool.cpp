#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

#include <boost/program_options.hpp>

#include <lumen/encode.hpp>
#include <lumen/identity.hpp>
#include <lumen/log.hpp>
#include <lumen/protocol.hpp>

namespace program_options = boost::program_options;

static lumen::identity::result< lumen::identity::keypair > load_keypair( const program_options::variables_map& args )
{
  if( args.count( "seed" ) )
    return lumen::identity::keypair::from_seed( args[ "seed" ].as< std::string >() );

  if( args.count( "address" ) )
    return lumen::identity::keypair::from_address( args[ "address" ].as< std::string >() );

  if( args.count( "mnemonic" ) )
    return lumen::identity::keypair::from_mnemonic( args[ "mnemonic" ].as< std::string >(),
                                                    args[ "passphrase" ].as< std::string >(),
                                                    args[ "language" ].as< std::string >(),
                                                    args[ "index" ].as< std::uint32_t >() );

  if( args.count( "legacy-seed" ) )
    return lumen::identity::legacy::from_seed( args[ "legacy-seed" ].as< std::string >() );

  return lumen::identity::keypair::random();
}

auto main( int argc, char** argv ) -> int
{
  program_options::options_description options;

  // clang-format off
  options.add_options()
    ( "help,h"       , "Print this help message and exit" )
    ( "version,v"    , "Print version string and exit" )
    ( "log-level,l"  , program_options::value< std::string >()->default_value( "warning" ), "The log filtering level" )
    ( "random,r"     , "Generate a random keypair (default when no other source is given)" )
    ( "seed,s"       , program_options::value< std::string >(), "Load a keypair from a strkey seed (S...)" )
    ( "address,a"    , program_options::value< std::string >(), "Load a verify-only keypair from a strkey address (G...)" )
    ( "mnemonic,m"   , program_options::value< std::string >(), "Derive a keypair from a mnemonic phrase" )
    ( "passphrase"   , program_options::value< std::string >()->default_value( "" ), "The mnemonic passphrase" )
    ( "language"     , program_options::value< std::string >()->default_value( "english" ), "The mnemonic language" )
    ( "index"        , program_options::value< std::uint32_t >()->default_value( 0 ), "The mnemonic keypair index" )
    ( "legacy-seed"  , program_options::value< std::string >(), "Load a keypair from a deprecated base58 seed" )
    ( "legacy"       , "Also print the deprecated base58 address and seed" )
    ( "xdr"          , "Also print the base64 XDR public key" )
    ( "sign"         , program_options::value< std::string >(), "Sign the given hex payload" )
    ( "verify"       , program_options::value< std::string >(), "Verify the given hex payload against --signature" )
    ( "signature"    , program_options::value< std::string >(), "The hex signature to verify" );
  // clang-format on

  program_options::variables_map args;

  try
  {
    program_options::store( program_options::parse_command_line( argc, argv, options ), args );
    program_options::notify( args );
  }
  catch( const program_options::error& e )
  {
    std::cerr << e.what() << std::endl;
    return EXIT_FAILURE;
  }

  if( args.count( "help" ) )
  {
    options.print( std::cout );
    return EXIT_SUCCESS;
  }

  if( args.count( "version" ) )
  {
    std::cout << "v0.1.0" << std::endl;
    return EXIT_SUCCESS;
  }

  auto level = lumen::log::level_from_string( args[ "log-level" ].as< std::string >() );
  if( !level )
  {
    std::cerr << "Invalid log level: " << args[ "log-level" ].as< std::string >() << std::endl;
    return EXIT_FAILURE;
  }

  lumen::log::initialize( *level );

  auto kp = load_keypair( args );
  if( !kp )
  {
    LOG_ERROR( lumen::log::instance(), "Unable to load keypair: {}", kp.error().message() );
    return EXIT_FAILURE;
  }

  std::cout << "address: " << kp->address() << std::endl;

  if( auto seed = kp->seed(); seed )
    std::cout << "seed:    " << *seed << std::endl;

  if( args.count( "xdr" ) )
    std::cout << "xdr:     " << kp->xdr() << std::endl;

  if( args.count( "legacy" ) )
  {
    if( auto address = lumen::identity::legacy::address( *kp ); address )
      std::cout << "legacy address: " << *address << std::endl;
    else
      LOG_ERROR( lumen::log::instance(), "Unable to compute legacy address: {}", address.error().message() );

    if( auto seed = lumen::identity::legacy::seed( *kp ); seed )
      std::cout << "legacy seed:    " << *seed << std::endl;
  }

  if( args.count( "sign" ) )
  {
    auto payload = lumen::encode::from_hex( args[ "sign" ].as< std::string >() );
    if( !payload )
    {
      LOG_ERROR( lumen::log::instance(), "Invalid payload: {}", payload.error().message() );
      return EXIT_FAILURE;
    }

    auto decorated = kp->sign_decorated( *payload );
    if( !decorated )
    {
      LOG_ERROR( lumen::log::instance(), "Unable to sign payload: {}", decorated.error().message() );
      return EXIT_FAILURE;
    }

    std::cout << "signature: " << lumen::encode::to_hex( decorated->signature ) << std::endl;
    std::cout << "hint:      " << lumen::encode::to_hex( decorated->hint ) << std::endl;
    std::cout << "decorated: " << lumen::encode::to_base64( lumen::protocol::to_xdr( *decorated ) ) << std::endl;
  }

  if( args.count( "verify" ) )
  {
    if( !args.count( "signature" ) )
    {
      LOG_ERROR( lumen::log::instance(), "--verify requires --signature" );
      return EXIT_FAILURE;
    }

    auto payload   = lumen::encode::from_hex( args[ "verify" ].as< std::string >() );
    auto signature = lumen::encode::from_hex( args[ "signature" ].as< std::string >() );
    if( !payload || !signature )
    {
      LOG_ERROR( lumen::log::instance(), "Invalid hex input" );
      return EXIT_FAILURE;
    }

    bool valid = kp->verify( *payload, *signature );
    std::cout << "verified:  " << ( valid ? "true" : "false" ) << std::endl;

    if( !valid )
      return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
