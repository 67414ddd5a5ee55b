#pragma once

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include "yedit.hh"

namespace yedit_test {

  using yedit::ordered_node;

  inline ordered_node yaml( const std::string& text ) {
    return ordered_node::deserialize( text );
  }

  inline const ordered_node& get( const ordered_node& n,
    const std::string& key )
  {
    return n.at( key );
  }

  inline bool has( const ordered_node& n, const std::string& key ) {
    return n.contains( key );
  }

  inline const ordered_node& elem( const ordered_node& seq, size_t i ) {
    return seq.at( i );
  }

  inline std::string str( const ordered_node& n ) {
    return n.get_value< std::string >();
  }

  inline std::int64_t integer( const ordered_node& n ) {
    return n.get_value< std::int64_t >();
  }

  inline std::vector< std::string > keys( const ordered_node& table ) {
    std::vector< std::string > out;
    for ( const auto& [mk, mv] : table.map_items() ) {
      out.push_back( mk.get_value< std::string >() );
    }
    return out;
  }

  inline std::string read_file( const std::filesystem::path& p ) {
    std::ifstream in( p, std::ios::binary );
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
  }

  inline void write_file( const std::filesystem::path& p,
    const std::string& text )
  {
    std::ofstream out( p, std::ios::binary | std::ios::trunc );
    out << text;
  }

  inline ordered_node load( const std::filesystem::path& p ) {
    return yedit::DocumentFile::parse_document( read_file(p), p.string() );
  }

  // Fresh directory per test, removed afterwards
  class TempDirTest : public ::testing::Test {
  protected:
    std::filesystem::path dir;

    void SetUp() override {
      const ::testing::TestInfo* info
        = ::testing::UnitTest::GetInstance()->current_test_info();
      dir = std::filesystem::temp_directory_path()
        / ( std::string("yedit_") + info->test_suite_name() + "_"
          + info->name() );
      std::filesystem::remove_all( dir );
      std::filesystem::create_directories( dir );
    }

    void TearDown() override {
      std::error_code ec;
      std::filesystem::remove_all( dir, ec );
    }
  };

} // namespace yedit_test
