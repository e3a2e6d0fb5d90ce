#include "api_word.hpp"
#include "errors.hpp"

std::vector<uint8_t> encodeLength( uint32_t len ) {
    if( len < 0x80 ) {
        return { static_cast<uint8_t>( len ) };
    } else if( len < 0x4000 ) {
        return {
            static_cast<uint8_t>( ( len >> 8 ) | 0x80 ),
            static_cast<uint8_t>( len )
        };
    } else if( len < 0x200000 ) {
        return {
            static_cast<uint8_t>( ( len >> 16 ) | 0xC0 ),
            static_cast<uint8_t>( len >> 8 ),
            static_cast<uint8_t>( len )
        };
    } else if( len < 0x10000000 ) {
        return {
            static_cast<uint8_t>( ( len >> 24 ) | 0xE0 ),
            static_cast<uint8_t>( len >> 16 ),
            static_cast<uint8_t>( len >> 8 ),
            static_cast<uint8_t>( len )
        };
    }
    return {
        0xF0,
        static_cast<uint8_t>( len >> 24 ),
        static_cast<uint8_t>( len >> 16 ),
        static_cast<uint8_t>( len >> 8 ),
        static_cast<uint8_t>( len )
    };
}

size_t prefixSize( uint8_t first ) {
    if( first < 0x80 ) {
        return 1;
    } else if( first < 0xC0 ) {
        return 2;
    } else if( first < 0xE0 ) {
        return 3;
    } else if( first < 0xF0 ) {
        return 4;
    } else if( first == 0xF0 ) {
        return 5;
    }
    // 0xF1..0xFF are control bytes, never a length
    return 0;
}

uint32_t decodeLength( const uint8_t *data, size_t size ) {
    switch( size ) {
    case 1:
        return data[ 0 ];
    case 2:
        return ( static_cast<uint32_t>( data[ 0 ] & 0x3F ) << 8 ) | data[ 1 ];
    case 3:
        return ( static_cast<uint32_t>( data[ 0 ] & 0x1F ) << 16 ) |
            ( static_cast<uint32_t>( data[ 1 ] ) << 8 ) | data[ 2 ];
    case 4:
        return ( static_cast<uint32_t>( data[ 0 ] & 0x0F ) << 24 ) |
            ( static_cast<uint32_t>( data[ 1 ] ) << 16 ) |
            ( static_cast<uint32_t>( data[ 2 ] ) << 8 ) | data[ 3 ];
    case 5:
        return ( static_cast<uint32_t>( data[ 1 ] ) << 24 ) |
            ( static_cast<uint32_t>( data[ 2 ] ) << 16 ) |
            ( static_cast<uint32_t>( data[ 3 ] ) << 8 ) | data[ 4 ];
    default:
        throw ApiProtocolError( "malformed length prefix" );
    }
}

std::vector<uint8_t> encodeWord( const std::string &word ) {
    auto ret = encodeLength( word.size() );
    ret.insert( ret.end(), word.begin(), word.end() );
    return ret;
}

std::vector<uint8_t> encodeSentence( const api_sentence_t &words ) {
    std::vector<uint8_t> ret;
    for( auto const &w: words ) {
        auto temp = encodeWord( w );
        ret.insert( ret.end(), temp.begin(), temp.end() );
    }
    ret.push_back( 0 );
    return ret;
}

void WordDecoder::feed( const uint8_t *data, size_t len ) {
    if( pos == buf.size() ) {
        buf.clear();
        pos = 0;
    }
    buf.insert( buf.end(), data, data + len );
}

std::optional<std::string> WordDecoder::next() {
    if( buffered() == 0 ) {
        return std::nullopt;
    }

    auto psize = prefixSize( buf[ pos ] );
    if( psize == 0 ) {
        throw ApiProtocolError( "malformed length prefix: first byte " + std::to_string( buf[ pos ] ) );
    }
    if( buffered() < psize ) {
        return std::nullopt;
    }

    auto len = decodeLength( buf.data() + pos, psize );
    if( buffered() < psize + len ) {
        return std::nullopt;
    }

    auto begin = buf.begin() + pos + psize;
    std::string word { begin, begin + len };
    pos += psize + len;

    if( pos > 4096 ) {
        buf.erase( buf.begin(), buf.begin() + pos );
        pos = 0;
    }
    return word;
}

std::optional<api_sentence_t> SentenceDecoder::next() {
    while( auto word = words.next() ) {
        if( !word->empty() ) {
            current.push_back( std::move( *word ) );
            continue;
        }
        if( current.empty() ) {
            continue;
        }
        api_sentence_t ret;
        ret.swap( current );
        return ret;
    }
    return std::nullopt;
}

bool isFinalSentence( const api_sentence_t &sentence ) {
    if( sentence.empty() ) {
        return false;
    }
    return sentence.front() == "!done" || sentence.front() == "!fatal";
}

std::optional<std::pair<std::string,std::string>> splitAttribute( const std::string &word ) {
    if( word.size() < 2 || word.front() != '=' ) {
        return std::nullopt;
    }
    auto eq = word.find( '=', 1 );
    if( eq == std::string::npos ) {
        return std::nullopt;
    }
    return std::make_pair( word.substr( 1, eq - 1 ), word.substr( eq + 1 ) );
}

ApiReply parseReply( const std::vector<std::string> &words ) {
    ApiReply reply;
    api_record_t trap_attrs;
    api_record_t *target = nullptr;

    for( auto const &word: words ) {
        if( word.empty() ) {
            continue;
        }
        if( word == "!re" ) {
            reply.records.emplace_back();
            target = &reply.records.back();
        } else if( word == "!done" ) {
            target = &reply.done;
        } else if( word == "!trap" ) {
            reply.trap = true;
            target = &trap_attrs;
        } else if( word == "!fatal" ) {
            reply.fatal = true;
            target = nullptr;
        } else if( auto attr = splitAttribute( word ); attr.has_value() ) {
            if( target != nullptr ) {
                ( *target )[ attr->first ] = attr->second;
            }
        } else if( reply.fatal ) {
            // !fatal carries its reason as a bare word
            if( !reply.message.empty() ) {
                reply.message += " ";
            }
            reply.message += word;
        }
    }

    if( reply.trap ) {
        if( auto const &it = trap_attrs.find( "message" ); it != trap_attrs.end() ) {
            reply.message = it->second;
        }
    }
    return reply;
}
