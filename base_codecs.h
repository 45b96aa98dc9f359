#ifndef BASE_CODECS_H
#define BASE_CODECS_H

#include <string>

// Alphabets of the codecs that no library in the stack provides.
constexpr char BASE45_ALPHABET[] = "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZ $%*+-./:";
constexpr char BASE91_ALPHABET[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789"
    "!#$%&()*+,./:;<=>?@[]^_`{|}~\"";
constexpr char BASE85_ALPHABET[] =
    "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz"
    "!#$%&()*+-;<=>?@^_`{|}~";

// Each decoder returns false on a character outside its alphabet or a
// malformed length/value; `out` is left untouched in that case.
bool base45_decode(const std::string& token, std::string& out);
bool base91_decode(const std::string& token, std::string& out);
bool ascii85_decode(const std::string& token, std::string& out);
bool base85_decode(const std::string& token, std::string& out);

std::string base45_encode(const std::string& data);
std::string base91_encode(const std::string& data);
std::string ascii85_encode(const std::string& data);
std::string base85_encode(const std::string& data);

#endif
