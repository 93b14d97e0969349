#include "huffman.hpp"
#include <algorithm>

#define MAKE_LOOKUP(code, bits) ((uint16_t)(((code) << 5) | ((bits) & 0x1F)))

Bit_Reader::Bit_Reader(const uint8_t* data, uint32_t length) :
    m_buffer(0), m_bits(0), m_read(data), m_doffset(0), m_dlength(length)
{

}

uint32_t Bit_Reader::peek(int numbits)
{
    if (numbits == 0)
        return 0;

    // fetch data if we need more
    if (numbits > m_bits)
    {
        while (m_bits <= 24)
        {
            if (m_doffset < m_dlength)
                m_buffer |= (uint32_t)m_read[m_doffset] << (24 - m_bits);
            m_doffset++;
            m_bits += 8;
        }
    }

    return m_buffer >> (32 - numbits);
}

void Bit_Reader::remove(int numbits)
{
    m_buffer = (numbits >= 32) ? 0 : (m_buffer << numbits);
    m_bits -= numbits;
}

uint32_t Bit_Reader::read(int numbits)
{
    uint32_t result = peek(numbits);
    remove(numbits);
    return result;
}

uint32_t Bit_Reader::read_offset() const
{
    uint32_t result = m_doffset;
    int bits = m_bits;
    while (bits >= 8)
    {
        result--;
        bits -= 8;
    }
    return result;
}

bool Bit_Reader::overflow() const
{
    return (m_doffset - m_bits / 8) > m_dlength;
}

Huffman_Decoder::Huffman_Decoder(uint32_t numcodes, uint8_t maxbits) :
    m_numcodes(numcodes), m_maxbits(maxbits), m_nodes(numcodes), m_lookup((size_t)1 << maxbits)
{

}

bool Huffman_Decoder::import_tree_rle(Bit_Reader& bits)
{
    // bits per entry depends on the maxbits
    int numbits;
    if (m_maxbits >= 16)
        numbits = 5;
    else if (m_maxbits >= 8)
        numbits = 4;
    else
        numbits = 3;

    uint32_t curnode = 0;
    while (curnode < m_numcodes)
    {
        int nodebits = bits.read(numbits);
        if (nodebits != 1)
        {
            m_nodes[curnode++].numbits = nodebits;
            continue;
        }

        // a one value is an escape code; a double 1 is just a single 1
        nodebits = bits.read(numbits);
        if (nodebits == 1)
        {
            m_nodes[curnode++].numbits = nodebits;
            continue;
        }

        int repcount = bits.read(numbits) + 3;
        if (repcount + curnode > m_numcodes)
            return false;
        while (repcount--)
            m_nodes[curnode++].numbits = nodebits;
    }

    if (curnode != m_numcodes)
        return false;

    if (!assign_canonical_codes())
        return false;
    build_lookup_table();

    return !bits.overflow();
}

bool Huffman_Decoder::import_tree_huffman(Bit_Reader& bits)
{
    // start by parsing the lengths for the small tree
    Huffman_Decoder smallhuff(24, 6);
    smallhuff.m_nodes[0].numbits = bits.read(3);
    int start = bits.read(3) + 1;
    int count = 0;
    for (int index = 1; index < 24; index++)
    {
        if (index < start || count == 7)
            smallhuff.m_nodes[index].numbits = 0;
        else
        {
            count = bits.read(3);
            smallhuff.m_nodes[index].numbits = (count == 7) ? 0 : count;
        }
    }

    if (!smallhuff.assign_canonical_codes())
        return false;
    smallhuff.build_lookup_table();

    // determine the maximum length of an RLE count
    uint32_t temp = m_numcodes - 9;
    int rlefullbits = 0;
    while (temp != 0)
    {
        temp >>= 1;
        rlefullbits++;
    }

    uint32_t curcode = 0;
    int last = 0;
    while (curcode < m_numcodes)
    {
        int value = smallhuff.decode_one(bits);
        if (value != 0)
        {
            last = value - 1;
            m_nodes[curcode++].numbits = last;
        }
        else
        {
            int repeat = bits.read(3) + 2;
            if (repeat == 7 + 2)
                repeat += bits.read(rlefullbits);
            for ( ; repeat != 0 && curcode < m_numcodes; repeat--)
                m_nodes[curcode++].numbits = last;
        }
    }

    if (curcode != m_numcodes)
        return false;

    if (!assign_canonical_codes())
        return false;
    build_lookup_table();

    return !bits.overflow();
}

uint32_t Huffman_Decoder::decode_one(Bit_Reader& bits)
{
    uint32_t index = bits.peek(m_maxbits);
    uint16_t lookup = m_lookup[index];
    bits.remove(lookup & 0x1F);
    return lookup >> 5;
}

bool Huffman_Decoder::assign_canonical_codes()
{
    // build up a histogram of bit lengths
    uint32_t bithisto[33] = { 0 };
    for (uint32_t curcode = 0; curcode < m_numcodes; curcode++)
    {
        const Node& node = m_nodes[curcode];
        if (node.numbits > m_maxbits)
            return false;
        bithisto[node.numbits]++;
    }

    // for each code length, determine the starting code number
    uint32_t curstart = 0;
    for (int codelen = 32; codelen > 0; codelen--)
    {
        uint32_t nextstart = (curstart + bithisto[codelen]) >> 1;
        if (codelen != 1 && nextstart * 2 != (curstart + bithisto[codelen]))
            return false;
        bithisto[codelen] = curstart;
        curstart = nextstart;
    }

    for (uint32_t curcode = 0; curcode < m_numcodes; curcode++)
    {
        Node& node = m_nodes[curcode];
        if (node.numbits > 0)
            node.bits = bithisto[node.numbits]++;
    }
    return true;
}

void Huffman_Decoder::build_lookup_table()
{
    std::fill(m_lookup.begin(), m_lookup.end(), 0);
    for (uint32_t curcode = 0; curcode < m_numcodes; curcode++)
    {
        const Node& node = m_nodes[curcode];
        if (node.numbits == 0)
            continue;

        // fill all matching entries
        int shift = m_maxbits - node.numbits;
        uint16_t value = MAKE_LOOKUP(curcode, node.numbits);
        size_t first = (size_t)node.bits << shift;
        size_t last = ((size_t)(node.bits + 1) << shift) - 1;
        for (size_t i = first; i <= last && i < m_lookup.size(); i++)
            m_lookup[i] = value;
    }
}
