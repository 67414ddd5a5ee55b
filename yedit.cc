#include "yedit.hh"

int main( int argc, char** argv ) {
  const std::vector< std::string > args( argv + 1, argv + argc );
  try {
    const yedit::Options options = yedit::parse_options( args );
    if ( options.help ) {
      std::cout << yedit::usage();
      return yedit::STATUS_OK;
    }
    return yedit::run( options, std::cerr );
  } catch (const std::exception& ex) {
    std::cerr << "[yedit] error: " << ex.what() << "\n\n" << yedit::usage();
    return yedit::STATUS_USAGE;
  }
}
