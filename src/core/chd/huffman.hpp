#ifndef HUFFMAN_HPP
#define HUFFMAN_HPP
#include <cstdint>
#include <vector>

//MSB-first bit reader. Reading past the end yields zero bits and sets overflow().
class Bit_Reader
{
    public:
        Bit_Reader(const uint8_t* data, uint32_t length);

        uint32_t peek(int numbits);
        void remove(int numbits);
        uint32_t read(int numbits);

        //Byte offset of the first byte not yet consumed
        uint32_t read_offset() const;
        bool overflow() const;
    private:
        uint32_t m_buffer;
        int m_bits;
        const uint8_t* m_read;
        uint32_t m_doffset;
        uint32_t m_dlength;
};

//Canonical huffman decoder with a flat lookup table of 2^maxbits entries
class Huffman_Decoder
{
    public:
        Huffman_Decoder(uint32_t numcodes, uint8_t maxbits);

        //Code lengths stored raw with a run-length escape; used by the v5 hunk map
        bool import_tree_rle(Bit_Reader& bits);

        //Code lengths themselves huffman coded by a small 24 symbol tree; used by the huff codec
        bool import_tree_huffman(Bit_Reader& bits);

        uint32_t decode_one(Bit_Reader& bits);
    private:
        struct Node
        {
            uint32_t bits;
            uint8_t numbits;
        };

        uint32_t m_numcodes;
        uint8_t m_maxbits;
        std::vector<Node> m_nodes;
        std::vector<uint16_t> m_lookup;

        bool assign_canonical_codes();
        void build_lookup_table();
};

#endif // HUFFMAN_HPP
