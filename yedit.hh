// ╻ ╻┏━╸╺┳┓╻╺┳╸
// ┗┳┛┣╸  ┃┃┃ ┃
//  ╹ ┗━╸╺┻┛╹ ╹
//  YAML document Editor
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by the yedit authors
#pragma once

// Standard library includes
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// fkYAML single-header library
// https://github.com/fktn-k/fkYAML
#include "fkYAML/node.hpp"

namespace yedit {

  // Specialized version of the fkYAML basic_node template. In particular,
  // the choice of fkyaml::ordered_map preserves the lexical order of the input
  // so that an edited document is written back in its original key order.
  using ordered_node = fkyaml::basic_node<
    std::vector, // sequence container
    fkyaml::ordered_map, // mapping container
    bool,
    std::int64_t,
    double,
    std::string,
    fkyaml::node_value_converter
  >;

namespace internal {

  inline constexpr char PATH_DELIMITER = '.';
  inline constexpr char BASIC_QUOTE = '"';
  inline constexpr char LITERAL_QUOTE = '\'';
  inline constexpr char BACKUP_SUFFIX = '~';

  // Label used for the document root (or prefix table) in messages
  inline const std::string DOC_ROOT = "<root>";

  // Name searched for when no document file is given explicitly
  inline const std::string DEFAULT_FIND_NAME = "config.yaml";

  // Placeholder for a value that was never supplied on the command line
  inline const std::string MISSING_VALUE = "(missing)";

  // Characters allowed in an unquoted key segment
  inline bool is_bare_key_char( char ch ) {
    unsigned char c = static_cast< unsigned char >( ch );
    return std::isalnum( c ) || c == '_' || c == '-';
  }

  inline bool is_blank( char ch ) {
    return ch == ' ' || ch == '\t';
  }

  inline bool is_bare_key( const std::string& seg ) {
    if ( seg.empty() ) return false;
    for ( char c : seg ) {
      if ( !is_bare_key_char(c) ) return false;
    }
    return true;
  }

  inline std::string trim( const std::string& s ) {
    static const char* const ws = " \t\r\n";
    const std::size_t first = s.find_first_not_of( ws );
    if ( first == std::string::npos ) return std::string();
    const std::size_t last = s.find_last_not_of( ws );
    return s.substr( first, last - first + 1 );
  }

  // Connects segments into a display path string with PATH_DELIMITER
  inline std::string join_path( const std::vector< std::string >& segs ) {
    std::string s;
    for ( size_t i = 0; i < segs.size(); ++i ) {
      if ( i ) s += PATH_DELIMITER;
      s += segs[ i ];
    }
    return s;
  }

  // Append a numerical index to the end of a base path string
  inline std::string seq_indexed( const std::string& base, size_t idx ) {
    return base + '[' + std::to_string( idx ) + ']';
  }

  template < typename T >
  inline ordered_node make_node_from( const T& value ) {
    ordered_node n;
    fkyaml::node_value_converter< T >::to_node( n, value );
    return n;
  }

  // Human-readable name of the shape of a node, used in error messages
  inline std::string node_type_name( const ordered_node& n ) {
    if ( n.is_mapping() ) return "mapping";
    if ( n.is_sequence() ) return "sequence";
    if ( n.is_string() ) return "string";
    if ( n.is_integer() ) return "integer";
    if ( n.is_float_number() ) return "float";
    if ( n.is_boolean() ) return "boolean";
    return "null";
  }

  // The editor only handles tree-shaped documents keyed by strings. Anchors
  // and aliases would share sub-nodes between several keys, and non-string
  // mapping keys cannot be addressed by a key path. Returns a description of
  // the first violation found, if any.
  inline std::optional< std::string > find_tree_violation(
    const ordered_node& node, const std::vector< std::string >& path )
  {
    const std::string here = join_path( path );

    if ( node.is_anchor() || node.is_alias() ) {
      std::ostringstream oss;
      oss << here << ": YAML ";
      oss << ( node.is_anchor() ? "anchors" : "aliases" );
      oss << " are not supported";
      return oss.str();
    }

    if ( node.is_mapping() ) {
      for ( const auto& [mk, mv] : node.map_items() ) {
        if ( !mk.is_string() ) {
          std::ostringstream oss;
          oss << here << ": mapping keys must be strings (found "
            << node_type_name( mk ) << " key)";
          return oss.str();
        }
        std::vector< std::string > p2 = path;
        p2.push_back( mk.get_value< std::string >() );
        if ( auto v = find_tree_violation(mv, p2) ) return v;
      }
    }
    else if ( node.is_sequence() ) {
      for ( size_t i = 0; i < node.size(); ++i ) {
        std::vector< std::string > p2 = path;
        if ( p2.empty() ) p2.push_back( std::string() );
        p2.back() = seq_indexed( p2.back(), i );
        if ( auto v = find_tree_violation(node.at(i), p2) ) return v;
      }
    }
    return std::nullopt;
  }

  // Append by rebuilding the sequence with the new element at the end
  inline void append_to_sequence( ordered_node& seq,
    const ordered_node& value )
  {
    std::vector< ordered_node > items;
    items.reserve( seq.size() + 1 );
    for ( size_t i = 0; i < seq.size(); ++i ) {
      items.push_back( seq.at(i) );
    }
    items.push_back( value );
    seq = make_node_from( items );
  }

  // Rebuild a mapping without one of its keys, keeping the order of the rest
  inline void erase_key( ordered_node& table, const std::string& key ) {
    ordered_node kept = ordered_node::mapping();
    for ( const auto& [mk, mv] : table.map_items() ) {
      const std::string k = mk.get_value< std::string >();
      if ( k == key ) continue;
      kept[ k ] = mv;
    }
    table = kept;
  }

  inline void append_utf8( std::string& out, std::uint32_t cp ) {
    if ( cp < 0x80 ) {
      out += static_cast< char >( cp );
    } else if ( cp < 0x800 ) {
      out += static_cast< char >( 0xC0 | (cp >> 6) );
      out += static_cast< char >( 0x80 | (cp & 0x3F) );
    } else if ( cp < 0x10000 ) {
      out += static_cast< char >( 0xE0 | (cp >> 12) );
      out += static_cast< char >( 0x80 | ((cp >> 6) & 0x3F) );
      out += static_cast< char >( 0x80 | (cp & 0x3F) );
    } else {
      out += static_cast< char >( 0xF0 | (cp >> 18) );
      out += static_cast< char >( 0x80 | ((cp >> 12) & 0x3F) );
      out += static_cast< char >( 0x80 | ((cp >> 6) & 0x3F) );
      out += static_cast< char >( 0x80 | (cp & 0x3F) );
    }
  }

  [[noreturn]] inline void throw_key_error( const std::string& text,
    size_t pos, const std::string& msg )
  {
    std::ostringstream oss;
    oss << "Invalid key '" << text << "': " << msg << " (column "
      << pos + 1 << ')';
    throw std::runtime_error( oss.str() );
  }

  // Quote a segment with basic (double) quotes, escaping as needed
  inline std::string quote_segment( const std::string& seg ) {
    std::string out( 1, BASIC_QUOTE );
    for ( char ch : seg ) {
      switch ( ch ) {
        case '"': out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '\b': out += "\\b"; break;
        case '\t': out += "\\t"; break;
        case '\n': out += "\\n"; break;
        case '\f': out += "\\f"; break;
        case '\r': out += "\\r"; break;
        default: {
          unsigned char c = static_cast< unsigned char >( ch );
          if ( c < 0x20 || c == 0x7F ) {
            static const char* const hex = "0123456789ABCDEF";
            out += "\\u00";
            out += hex[ c >> 4 ];
            out += hex[ c & 0x0F ];
          } else {
            out += ch;
          }
        }
      }
    }
    out += BASIC_QUOTE;
    return out;
  }

} // namespace yedit::internal

  // An ordered sequence of key segments addressing a node from the document
  // root. The empty path addresses the root itself.
  class KeyPath {
  public:
    KeyPath() = default;
    inline KeyPath( std::initializer_list< std::string > segs )
      : segs_( segs ) {}
    inline explicit KeyPath( std::vector< std::string > segs )
      : segs_( std::move(segs) ) {}

    // Parse dotted key text: segments are bare ([A-Za-z0-9_-]+), "basic"
    // quoted (with escapes) or 'literal' quoted, separated by dots with
    // optional blanks around them. Throws std::runtime_error when malformed.
    static KeyPath parse( const std::string& text );

    // Inverse of parse(): bare segments stay as they are, all others are
    // written as basic quoted strings
    std::string format() const;

    bool empty() const { return segs_.empty(); }
    size_t size() const { return segs_.size(); }
    const std::string& operator[]( size_t i ) const { return segs_[ i ]; }

    // Final segment; throws std::invalid_argument on the empty path
    const std::string& leaf() const;

    // All segments but the last (the empty path stays empty)
    KeyPath parent() const;

    // First n segments
    KeyPath prefix( size_t n ) const;

    KeyPath child( const std::string& seg ) const;

    bool operator==( const KeyPath& other ) const
      { return segs_ == other.segs_; }
    bool operator!=( const KeyPath& other ) const
      { return segs_ != other.segs_; }

  private:
    std::vector< std::string > segs_;
  };

  // Structural failures of the navigation and mutation engine
  enum class ErrorKind {
    NotAMapping, // the addressed table exists but is not a mapping
    IntermediateConflict, // a non-final segment crosses a non-mapping value
    KeyNotFound // delete target is absent
  };

  struct EditError {
    ErrorKind kind;
    // For the mapping errors, the path consumed up to the offending value.
    // For KeyNotFound, the full path of the missing entry.
    KeyPath path;
    // Value found instead of a mapping (null for KeyNotFound)
    ordered_node found;

    // True for both "a mapping was required but not found" kinds
    bool is_no_mapping() const {
      return kind == ErrorKind::NotAMapping
        || kind == ErrorKind::IntermediateConflict;
    }

    std::string reason() const;
  };

  // Empty on success
  using EditResult = std::optional< EditError >;

  // Outcome of resolve_table(): either a table owned by the document or the
  // error that stopped the walk
  struct TableLookup {
    ordered_node* table = nullptr;
    std::optional< EditError > error;

    explicit operator bool() const { return table != nullptr; }
  };

  // Walk path from root, creating missing tables along the way. Tables
  // created before a failure stay in the document.
  inline TableLookup resolve_table( ordered_node& root, const KeyPath& path )
  {
    ordered_node* table = &root;
    for ( size_t i = 0; i < path.size(); ++i ) {
      if ( !table->is_mapping() ) {
        return { nullptr, EditError{ ErrorKind::IntermediateConflict,
          path.prefix(i), *table } };
      }
      const std::string& seg = path[ i ];
      if ( !table->contains(seg) ) {
        ( *table )[ seg ] = ordered_node::mapping();
      }
      table = &table->at( seg );
    }
    if ( !table->is_mapping() ) {
      return { nullptr, EditError{ ErrorKind::NotAMapping, path, *table } };
    }
    return { table, std::nullopt };
  }

  // Interpret raw command line text as a typed YAML value. Booleans,
  // numbers, quoted strings and flow collections ([...], {...}) are parsed;
  // everything else is kept verbatim as a string.
  inline ordered_node coerce( const std::string& raw ) {
    using internal::make_node_from;

    const std::string text = internal::trim( raw );
    if ( text.empty() ) return make_node_from( raw );

    ordered_node parsed;
    try {
      parsed = ordered_node::deserialize( text );
    }
    catch ( const std::exception& ) {
      // Not a YAML literal: plain text
      return make_node_from( raw );
    }

    if ( internal::find_tree_violation(parsed, {}) ) {
      return make_node_from( raw );
    }

    const char first = text.front();
    if ( parsed.is_boolean() || parsed.is_integer()
      || parsed.is_float_number() ) return parsed;
    if ( parsed.is_string()
      && (first == internal::BASIC_QUOTE || first == internal::LITERAL_QUOTE) )
    {
      return parsed;
    }
    if ( parsed.is_sequence() && first == '[' ) return parsed;
    if ( parsed.is_mapping() && first == '{' ) return parsed;

    // Nulls, unquoted strings (which YAML may have folded or cut at a
    // comment) and block collections keep the text as given
    return make_node_from( raw );
  }

  // Overwrite the entry at path with the coerced value
  inline EditResult set_value( ordered_node& root, const KeyPath& path,
    const std::string& raw )
  {
    const std::string& leaf = path.leaf();
    TableLookup parent = resolve_table( root, path.parent() );
    if ( !parent ) return parent.error;

    ( *parent.table )[ leaf ] = coerce( raw );
    return std::nullopt;
  }

  // Append the coerced value to the sequence at path. A missing entry
  // becomes a one-element sequence; any other existing value becomes the
  // first element of a new two-element sequence.
  inline EditResult add_value( ordered_node& root, const KeyPath& path,
    const std::string& raw )
  {
    const std::string& leaf = path.leaf();
    TableLookup parent = resolve_table( root, path.parent() );
    if ( !parent ) return parent.error;

    ordered_node& table = *parent.table;
    ordered_node value = coerce( raw );

    if ( !table.contains(leaf) ) {
      table[ leaf ] = internal::make_node_from(
        std::vector< ordered_node >{ value } );
      return std::nullopt;
    }

    ordered_node& current = table.at( leaf );
    if ( current.is_sequence() ) {
      internal::append_to_sequence( current, value );
    } else {
      std::vector< ordered_node > promoted = { current, value };
      current = internal::make_node_from( promoted );
    }
    return std::nullopt;
  }

  // Append when the entry is already a sequence, set otherwise
  inline EditResult set_or_add( ordered_node& root, const KeyPath& path,
    const std::string& raw )
  {
    const std::string& leaf = path.leaf();
    TableLookup parent = resolve_table( root, path.parent() );
    if ( !parent ) return parent.error;

    ordered_node& table = *parent.table;
    if ( table.contains(leaf) && table.at(leaf).is_sequence() ) {
      internal::append_to_sequence( table.at(leaf), coerce(raw) );
      return std::nullopt;
    }
    return set_value( table, KeyPath{ leaf }, raw );
  }

  inline EditResult delete_key( ordered_node& root, const KeyPath& path ) {
    const std::string& leaf = path.leaf();
    TableLookup parent = resolve_table( root, path.parent() );
    if ( !parent ) return parent.error;

    ordered_node& table = *parent.table;
    if ( !table.contains(leaf) ) {
      return EditError{ ErrorKind::KeyNotFound, path, ordered_node() };
    }
    internal::erase_key( table, leaf );
    return std::nullopt;
  }

  // Writes prefixed diagnostic lines to a stream. Informational messages
  // are only shown in verbose mode.
  class Reporter {
  public:
    inline explicit Reporter( std::ostream& out, bool verbose = false )
      : out_( out ), verbose_( verbose ) {}

    void info( const std::string& msg );
    void error( const std::string& msg );

    size_t error_count() const { return errors_; }

  private:
    std::ostream& out_;
    bool verbose_ = false;
    size_t errors_ = 0;
  };

  // Command modes, selected by the switch tokens @ = + -
  enum class Mode { Auto, Set, Add, Remove };

  inline std::optional< Mode > mode_from_token( const std::string& tok ) {
    if ( tok == "@" ) return Mode::Auto;
    if ( tok == "=" ) return Mode::Set;
    if ( tok == "+" ) return Mode::Add;
    if ( tok == "-" ) return Mode::Remove;
    return std::nullopt;
  }

  inline bool mode_takes_value( Mode mode ) {
    return mode != Mode::Remove;
  }

  struct BatchSummary {
    size_t applied = 0;
    size_t failed = 0;
    // Set when a missing trailing value stopped the batch
    bool truncated = false;

    bool ok() const { return failed == 0 && !truncated; }
  };

  // Interprets a flat token stream of mode switches and key/value pairs
  // against one root table. Failed commands are reported and skipped.
  class CommandRunner {
  public:
    inline CommandRunner( ordered_node& root, Reporter& reporter )
      : root_( root ), reporter_( reporter ) {}

    BatchSummary run( const std::vector< std::string >& tokens );

    // Apply a single parsed command (value is ignored for Mode::Remove)
    EditResult apply( Mode mode, const KeyPath& path,
      const std::string& value );

    static std::string failure_message( Mode mode, const std::string& key,
      const std::string& value, const std::string& reason );

  private:
    std::string describe( Mode mode, const KeyPath& path,
      const std::string& value ) const;

    ordered_node& root_;
    Reporter& reporter_;
  };

  // Nearest file called name in start or one of its parents. Falls back to
  // name itself (relative to the working directory) when there is none.
  inline std::filesystem::path find_in_parents( const std::string& name,
    const std::filesystem::path& start = std::filesystem::current_path() )
  {
    std::filesystem::path dir = std::filesystem::absolute( start );
    while ( true ) {
      const std::filesystem::path candidate = dir / name;
      if ( std::filesystem::exists(candidate) ) return candidate;
      if ( !dir.has_parent_path() || dir.parent_path() == dir ) break;
      dir = dir.parent_path();
    }
    return std::filesystem::path( name );
  }

  // Scoped access to the YAML file backing a document. The file is loaded on
  // construction (a missing file starts an empty mapping) and written back
  // when the object goes out of scope, unless save() already ran.
  class DocumentFile {
  public:
    DocumentFile( std::filesystem::path file, bool backup,
      Reporter& reporter );
    ~DocumentFile();

    DocumentFile( const DocumentFile& ) = delete;
    DocumentFile& operator=( const DocumentFile& ) = delete;

    ordered_node& document() { return doc_; }
    const std::filesystem::path& path() const { return file_; }

    // Write the document, first renaming the previous file to its backup
    // name when backups are enabled. Throws on I/O failure, and before
    // touching the file when the serialized text would not load back as
    // the same document.
    void save();

    // Parse YAML text into a document root. Empty text gives an empty
    // mapping; the root must be a string-keyed, anchor-free mapping.
    static ordered_node parse_document( const std::string& text,
      const std::string& origin );

  private:
    std::filesystem::path file_;
    bool backup_ = false;
    Reporter& reporter_;
    ordered_node doc_;
    bool saved_ = false;
  };

  // Exit statuses of run()
  inline constexpr int STATUS_OK = 0;
  inline constexpr int STATUS_FAILED = 1;
  inline constexpr int STATUS_USAGE = 2;

  struct Options {
    std::optional< std::filesystem::path > file;
    std::string find = internal::DEFAULT_FIND_NAME;
    std::optional< std::string > prefix;
    bool backup = false;
    bool verbose = false;
    bool help = false;
    std::vector< std::string > commands;
  };

  // Split command line arguments (without the program name) into options
  // and command tokens. Throws std::runtime_error for an option missing its
  // value.
  Options parse_options( const std::vector< std::string >& args );

  std::string usage();

  // Full editing session: locate and load the document, resolve the prefix,
  // apply the commands, write the document back. Returns an exit status.
  int run( const Options& options, std::ostream& log );

} // namespace yedit

// KeyPath member function definitions
inline yedit::KeyPath yedit::KeyPath::parse( const std::string& text ) {
  using internal::throw_key_error;

  std::vector< std::string > segs;
  const size_t n = text.size();
  size_t i = 0;

  auto skip_blanks = [&]() {
    while ( i < n && internal::is_blank(text[i]) ) ++i;
  };

  // Reads a "basic" quoted segment starting at the opening quote
  auto read_basic = [&]() -> std::string {
    std::string out;
    const size_t open = i++;
    while ( true ) {
      if ( i >= n || text[i] == '\n' ) {
        throw_key_error( text, open, "unterminated quoted segment" );
      }
      char c = text[ i++ ];
      if ( c == internal::BASIC_QUOTE ) return out;
      if ( c != '\\' ) { out += c; continue; }

      if ( i >= n ) throw_key_error( text, i, "incomplete escape sequence" );
      const size_t esc = i - 1;
      char e = text[ i++ ];
      switch ( e ) {
        case '"': out += '"'; break;
        case '\\': out += '\\'; break;
        case 'b': out += '\b'; break;
        case 't': out += '\t'; break;
        case 'n': out += '\n'; break;
        case 'f': out += '\f'; break;
        case 'r': out += '\r'; break;
        case 'u':
        case 'U': {
          const size_t digits = ( e == 'u' ) ? 4 : 8;
          if ( i + digits > n ) {
            throw_key_error( text, esc, "incomplete unicode escape" );
          }
          std::uint32_t cp = 0;
          for ( size_t d = 0; d < digits; ++d ) {
            const char h = text[ i + d ];
            if ( !std::isxdigit(static_cast< unsigned char >(h)) ) {
              throw_key_error( text, i + d, "invalid hex digit in escape" );
            }
            const std::uint32_t v = std::isdigit( static_cast< unsigned char >(h) )
              ? static_cast< std::uint32_t >( h - '0' )
              : static_cast< std::uint32_t >(
                  std::tolower(static_cast< unsigned char >(h)) - 'a' + 10 );
            cp = ( cp << 4 ) | v;
          }
          if ( cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF) ) {
            throw_key_error( text, esc, "escape is not a unicode scalar value" );
          }
          internal::append_utf8( out, cp );
          i += digits;
          break;
        }
        default:
          throw_key_error( text, esc,
            std::string("unknown escape sequence '\\") + e + "'" );
      }
    }
  };

  // Reads a 'literal' quoted segment (no escapes) starting at the quote
  auto read_literal = [&]() -> std::string {
    const size_t open = i++;
    const size_t close = text.find( internal::LITERAL_QUOTE, i );
    const size_t newline = text.find( '\n', i );
    if ( close == std::string::npos || newline < close ) {
      throw_key_error( text, open, "unterminated quoted segment" );
    }
    std::string out = text.substr( i, close - i );
    i = close + 1;
    return out;
  };

  while ( true ) {
    skip_blanks();
    if ( i >= n ) throw_key_error( text, i, "expected a key segment" );

    const char c = text[ i ];
    if ( c == internal::BASIC_QUOTE ) {
      segs.push_back( read_basic() );
    }
    else if ( c == internal::LITERAL_QUOTE ) {
      segs.push_back( read_literal() );
    }
    else if ( internal::is_bare_key_char(c) ) {
      const size_t start = i;
      while ( i < n && internal::is_bare_key_char(text[i]) ) ++i;
      segs.push_back( text.substr(start, i - start) );
    }
    else {
      throw_key_error( text, i,
        std::string("unexpected character '") + c + "'" );
    }

    skip_blanks();
    if ( i >= n ) break;
    if ( text[i] != internal::PATH_DELIMITER ) {
      throw_key_error( text, i, "expected '.' between key segments" );
    }
    ++i;
  }

  return KeyPath( std::move(segs) );
}

inline std::string yedit::KeyPath::format() const {
  std::string out;
  for ( size_t i = 0; i < segs_.size(); ++i ) {
    if ( i ) out += internal::PATH_DELIMITER;
    const std::string& seg = segs_[ i ];
    out += internal::is_bare_key( seg ) ? seg : internal::quote_segment( seg );
  }
  return out;
}

inline const std::string& yedit::KeyPath::leaf() const {
  if ( segs_.empty() ) {
    throw std::invalid_argument( "An empty key path has no final segment" );
  }
  return segs_.back();
}

inline yedit::KeyPath yedit::KeyPath::parent() const {
  if ( segs_.empty() ) return KeyPath();
  return prefix( segs_.size() - 1 );
}

inline yedit::KeyPath yedit::KeyPath::prefix( size_t n ) const {
  if ( n >= segs_.size() ) return *this;
  return KeyPath( std::vector< std::string >(segs_.begin(),
    segs_.begin() + static_cast< std::ptrdiff_t >(n)) );
}

inline yedit::KeyPath yedit::KeyPath::child( const std::string& seg ) const {
  std::vector< std::string > segs = segs_;
  segs.push_back( seg );
  return KeyPath( std::move(segs) );
}

inline std::string yedit::EditError::reason() const {
  const std::string where = path.empty() ? internal::DOC_ROOT : path.format();
  std::ostringstream oss;
  switch ( kind ) {
    case ErrorKind::NotAMapping:
    case ErrorKind::IntermediateConflict:
      oss << "Expected a mapping at key " << where << ", but got "
        << internal::node_type_name( found );
      break;
    case ErrorKind::KeyNotFound:
      oss << "No entry at key " << where;
      break;
  }
  return oss.str();
}

// Reporter member function definitions
inline void yedit::Reporter::info( const std::string& msg ) {
  if ( !verbose_ ) return;
  out_ << "[yedit] " << msg << '\n';
}

inline void yedit::Reporter::error( const std::string& msg ) {
  ++errors_;
  out_ << "[yedit] error: " << msg << '\n';
}

// CommandRunner member function definitions
inline yedit::BatchSummary yedit::CommandRunner::run(
  const std::vector< std::string >& tokens )
{
  BatchSummary summary;
  Mode mode = Mode::Auto;

  size_t i = 0;
  while ( i < tokens.size() ) {
    const std::string& token = tokens[ i++ ];
    if ( auto m = mode_from_token(token) ) {
      mode = *m;
      continue;
    }

    std::string value;
    if ( mode_takes_value(mode) ) {
      if ( i >= tokens.size() ) {
        reporter_.error( failure_message(mode, token, internal::MISSING_VALUE,
          "no more arguments") );
        summary.truncated = true;
        break;
      }
      value = tokens[ i++ ];
    }

    KeyPath path;
    try {
      path = KeyPath::parse( token );
    }
    catch ( const std::runtime_error& ex ) {
      reporter_.error( failure_message(mode, token, value, ex.what()) );
      ++summary.failed;
      continue;
    }

    if ( EditResult err = this->apply(mode, path, value) ) {
      reporter_.error( failure_message(mode, token, value, err->reason()) );
      ++summary.failed;
      continue;
    }

    ++summary.applied;
    reporter_.info( describe(mode, path, value) );
  }
  return summary;
}

inline yedit::EditResult yedit::CommandRunner::apply( Mode mode,
  const KeyPath& path, const std::string& value )
{
  switch ( mode ) {
    case Mode::Auto: return set_or_add( root_, path, value );
    case Mode::Set: return set_value( root_, path, value );
    case Mode::Add: return add_value( root_, path, value );
    case Mode::Remove: return delete_key( root_, path );
  }
  throw std::logic_error( "Unhandled command mode" );
}

inline std::string yedit::CommandRunner::failure_message( Mode mode,
  const std::string& key, const std::string& value,
  const std::string& reason )
{
  std::ostringstream oss;
  switch ( mode ) {
    case Mode::Set:
      oss << "Cannot set " << key << " to " << value;
      break;
    case Mode::Add:
      oss << "Cannot append " << value << " to " << key;
      break;
    case Mode::Remove:
      oss << "Cannot remove " << key;
      break;
    case Mode::Auto:
      oss << "Cannot set or append value " << value << " for key " << key;
      break;
  }
  oss << ": " << reason;
  return oss.str();
}

inline std::string yedit::CommandRunner::describe( Mode mode,
  const KeyPath& path, const std::string& value ) const
{
  const std::string key = path.format();
  switch ( mode ) {
    case Mode::Set: return "set " + key + " = " + value;
    case Mode::Add: return "appended " + value + " to " + key;
    case Mode::Remove: return "removed " + key;
    case Mode::Auto: break;
  }
  return "set or appended " + value + " at " + key;
}

// DocumentFile member function definitions
inline yedit::DocumentFile::DocumentFile( std::filesystem::path file,
  bool backup, Reporter& reporter )
  : file_( std::move(file) ), backup_( backup ), reporter_( reporter ),
    doc_( ordered_node::mapping() )
{
  if ( !std::filesystem::exists(file_) ) {
    reporter_.info( "Starting new document " + file_.string() );
    return;
  }

  std::ifstream in( file_, std::ios::binary );
  if ( !in ) {
    throw std::runtime_error( "Cannot open " + file_.string()
      + " for reading" );
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  doc_ = parse_document( ss.str(), file_.string() );
}

inline yedit::DocumentFile::~DocumentFile() {
  if ( saved_ ) return;
  try {
    this->save();
  }
  catch ( const std::exception& ex ) {
    reporter_.error( "Could not write " + file_.string() + ": " + ex.what() );
  }
}

inline void yedit::DocumentFile::save() {
  namespace fs = std::filesystem;

  // One attempt per session: a failed explicit save is not retried on scope
  // exit
  saved_ = true;

  // fkYAML quotes strings by their inferred scalar type only, so plain text
  // holding YAML syntax (": ", " #", a leading '>' or "- ") may be written
  // unquoted. Check the output reads back unchanged before replacing
  // anything on disk.
  const std::string text = ordered_node::serialize( doc_ );
  ordered_node reloaded;
  try {
    reloaded = parse_document( text, file_.string() );
  }
  catch ( const std::runtime_error& ex ) {
    throw std::runtime_error( "Refusing to write " + file_.string()
      + ": the serialized document does not parse back (" + ex.what()
      + ")" );
  }
  if ( !(reloaded == doc_) ) {
    throw std::runtime_error( "Refusing to write " + file_.string()
      + ": a value would not read back unchanged" );
  }

  if ( backup_ && fs::exists(file_) ) {
    fs::path backup_file = file_;
    backup_file += internal::BACKUP_SUFFIX;
    if ( fs::exists(backup_file) ) fs::remove( backup_file );
    fs::rename( file_, backup_file );
    reporter_.info( "Backup created at " + backup_file.string() );
  }

  std::ofstream out( file_, std::ios::binary | std::ios::trunc );
  if ( !out ) {
    throw std::runtime_error( "Cannot open " + file_.string()
      + " for writing" );
  }
  out << text;
  out.flush();
  if ( !out ) {
    throw std::runtime_error( "Failed while writing " + file_.string() );
  }
}

inline yedit::ordered_node yedit::DocumentFile::parse_document(
  const std::string& text, const std::string& origin )
{
  if ( internal::trim(text).empty() ) return ordered_node::mapping();

  ordered_node dom;
  try {
    dom = ordered_node::deserialize( text );
  }
  catch ( const std::exception& ex ) {
    std::ostringstream oss;
    oss << origin << ": cannot parse YAML document (" << ex.what() << ')';
    throw std::runtime_error( oss.str() );
  }

  // Comment-only documents
  if ( dom.is_null() ) return ordered_node::mapping();

  if ( !dom.is_mapping() ) {
    std::ostringstream oss;
    oss << origin << ": the document root must be a mapping, but is a "
      << internal::node_type_name( dom );
    throw std::runtime_error( oss.str() );
  }

  const std::vector< std::string > root_path = { internal::DOC_ROOT };
  if ( auto violation = internal::find_tree_violation(dom, root_path) ) {
    throw std::runtime_error( origin + ": " + *violation );
  }
  return dom;
}

inline yedit::Options yedit::parse_options(
  const std::vector< std::string >& args )
{
  Options opts;
  bool only_commands = false;

  for ( size_t i = 0; i < args.size(); ++i ) {
    const std::string& arg = args[ i ];
    if ( only_commands ) {
      opts.commands.push_back( arg );
      continue;
    }

    // Long options also accept the --name=value form
    std::string name = arg;
    std::optional< std::string > inline_value;
    if ( arg.rfind("--", 0) == 0 ) {
      const size_t eq = arg.find( '=' );
      if ( eq != std::string::npos ) {
        name = arg.substr( 0, eq );
        inline_value = arg.substr( eq + 1 );
      }
    }

    auto option_value = [&]() -> std::string {
      if ( inline_value ) return *inline_value;
      if ( i + 1 >= args.size() ) {
        throw std::runtime_error( "Option '" + name + "' requires a value" );
      }
      return args[ ++i ];
    };

    auto flag = [&]() -> bool {
      if ( inline_value ) {
        throw std::runtime_error( "Option '" + name + "' takes no value" );
      }
      return true;
    };

    if ( name == "--" && !inline_value ) only_commands = true;
    else if ( name == "-f" || name == "--file" ) opts.file = option_value();
    else if ( name == "-F" || name == "--find" ) opts.find = option_value();
    else if ( name == "-p" || name == "--prefix" ) opts.prefix = option_value();
    else if ( name == "-b" || name == "--backup" ) opts.backup = flag();
    else if ( name == "-v" || name == "--verbose" ) opts.verbose = flag();
    else if ( name == "-h" || name == "--help" ) opts.help = flag();
    else opts.commands.push_back( arg );
  }
  return opts;
}

inline std::string yedit::usage() {
  return
    "Usage: yedit [OPTIONS] [--] ARGS...\n"
    "\n"
    "Edit a YAML file, by default the nearest " + internal::DEFAULT_FIND_NAME
    + ".\n"
    "\n"
    "ARGS is a series of mode switches and key/value pairs. Keys are dotted\n"
    "paths such as super.sub.\"dotted.key\". Values are YAML literals\n"
    "(true, 42, 1.5, \"quoted\", [1, 2], {a: 1}) or plain strings.\n"
    "\n"
    "A mode switch applies to all following arguments until the next one:\n"
    "  @  key value ...  append to a sequence, otherwise set (default)\n"
    "  =  key value ...  set, replacing any existing value\n"
    "  +  key value ...  append; a missing entry becomes a sequence and a\n"
    "                    non-sequence entry becomes its first element\n"
    "  -  key ...        remove the entries\n"
    "\n"
    "Options:\n"
    "  -f, --file PATH    file to edit\n"
    "  -F, --find NAME    file name searched in the current directory and\n"
    "                     its parents when --file is absent\n"
    "  -p, --prefix KEY   all keys are below this table\n"
    "  -b, --backup       keep the previous file as FILE~\n"
    "  -v, --verbose      report the operations performed\n"
    "  -h, --help         show this text\n";
}

inline int yedit::run( const Options& options, std::ostream& log ) {
  Reporter reporter( log, options.verbose );

  if ( options.commands.empty() ) {
    reporter.error( "no commands given (see --help)" );
    return STATUS_USAGE;
  }

  std::optional< KeyPath > prefix;
  if ( options.prefix ) {
    try {
      prefix = KeyPath::parse( *options.prefix );
    }
    catch ( const std::runtime_error& ex ) {
      reporter.error( ex.what() );
      return STATUS_USAGE;
    }
  }

  try {
    const std::filesystem::path file = options.file ? *options.file
      : find_in_parents( options.find );
    DocumentFile doc( file, options.backup, reporter );

    ordered_node* root = &doc.document();
    if ( prefix ) {
      TableLookup lookup = resolve_table( doc.document(), *prefix );
      if ( !lookup ) {
        reporter.error( "Cannot edit below " + *options.prefix + ": "
          + lookup.error->reason() );
        return STATUS_FAILED;
      }
      root = lookup.table;
      reporter.info( "Editing " + file.string() + ", table "
        + *options.prefix );
    } else {
      reporter.info( "Editing " + file.string() );
    }

    CommandRunner runner( *root, reporter );
    const BatchSummary summary = runner.run( options.commands );
    doc.save();
    return summary.ok() ? STATUS_OK : STATUS_FAILED;
  }
  catch ( const std::exception& ex ) {
    reporter.error( ex.what() );
    return STATUS_FAILED;
  }
}
