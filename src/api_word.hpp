#ifndef API_WORD_HPP
#define API_WORD_HPP

#include <cstdint>
#include <string>
#include <vector>
#include <map>
#include <optional>

using api_record_t = std::map<std::string,std::string>;
using api_sentence_t = std::vector<std::string>;

// Length prefix of a word:
//   < 0x80       1 byte   0xxxxxxx
//   < 0x4000     2 bytes  10xxxxxx ...
//   < 0x200000   3 bytes  110xxxxx ...
//   < 0x10000000 4 bytes  1110xxxx ...
//   otherwise    5 bytes  11110000 + 4 bytes big endian
std::vector<uint8_t> encodeLength( uint32_t len );

// Size of the whole prefix announced by its first byte, 0 for a malformed one
size_t prefixSize( uint8_t first );

// `data` must hold exactly prefixSize( data[0] ) bytes
uint32_t decodeLength( const uint8_t *data, size_t size );

std::vector<uint8_t> encodeWord( const std::string &word );
std::vector<uint8_t> encodeSentence( const api_sentence_t &words );

// Accumulates bytes as they arrive from the stream and hands out words
// once they are complete.
class WordDecoder {
public:
    void feed( const uint8_t *data, size_t len );

    // Throws ApiProtocolError on a malformed length prefix
    std::optional<std::string> next();

    size_t buffered() const {
        return buf.size() - pos;
    }

private:
    std::vector<uint8_t> buf;
    size_t pos { 0 };
};

class SentenceDecoder {
public:
    void feed( const uint8_t *data, size_t len ) {
        words.feed( data, len );
    }

    std::optional<api_sentence_t> next();

    bool empty() const {
        return current.empty() && words.buffered() == 0;
    }

private:
    WordDecoder words;
    api_sentence_t current;
};

struct ApiReply {
    std::vector<api_record_t> records;
    // attributes carried by the !done sentence itself, e.g. =ret=
    api_record_t done;
    bool trap { false };
    bool fatal { false };
    std::string message;
};

// Sentence ends a reply when it starts with !done or !fatal
bool isFinalSentence( const api_sentence_t &sentence );

// Splits "=key=value" into { key, value }; nullopt for other words
std::optional<std::pair<std::string,std::string>> splitAttribute( const std::string &word );

// Works on the flattened word list of a reply, empty words are ignored
ApiReply parseReply( const std::vector<std::string> &words );

#endif
