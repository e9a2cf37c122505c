#include <gtest/gtest.h>
#include <string>
#include "../../Src/CompressionHelpers/CodecErrors.hpp"
#include "../../Src/CompressionHelpers/ContainerCodec.hpp"
#include "../../Src/CompressionHelpers/FrequencyAnalyzer.hpp"
#include "helpers/unitTestHelpers.hpp"

using namespace huffpack::algorithms;

class ContainerCodecTest : public ::testing::Test
{
protected:
    const std::vector<uint8_t> MockInput = toBytes("aaaabbbccd");
    const std::string MockExtension = ".txt";
    Container container;

    void SetUp() override
    {
        container.extension = MockExtension;
        container.originalSize = MockInput.size();
        container.tree = HuffmanTree::build(FrequencyAnalyzer::analyze(MockInput));
        container.payload = BitPacking::pack(MockInput, CodeTable::generate(container.tree));
    }

    // offset of the padding byte, the last fixed header field
    size_t paddingOffset() const
    {
        return 4 + 1 + 4 + MockExtension.size() + 8;
    }
};

TEST_F(ContainerCodecTest, Serialize_WritesHeaderFieldsInOrder)
{
    std::vector<uint8_t> buffer = ContainerCodec::serialize(container);

    ASSERT_GE(buffer.size(), paddingOffset() + 1);
    EXPECT_EQ(std::string(buffer.begin(), buffer.begin() + 4), "HUFP");
    EXPECT_EQ(buffer[4], CONTAINER_VERSION);
    EXPECT_EQ(buffer[5], MockExtension.size());
    EXPECT_EQ(buffer[6], 0);
    EXPECT_EQ(buffer[7], 0);
    EXPECT_EQ(buffer[8], 0);
    EXPECT_EQ(std::string(buffer.begin() + 9, buffer.begin() + 13), MockExtension);
    EXPECT_EQ(buffer[13], MockInput.size());
    for (size_t i = 14; i < 21; ++i)
    {
        EXPECT_EQ(buffer[i], 0);
    }
    EXPECT_EQ(buffer[paddingOffset()], 5);

    // 3 internal nodes x 1 bit + 4 leaves x 9 bits = 39 bits -> 5 bytes
    EXPECT_EQ(buffer.size(), CONTAINER_FIXED_HEADER_SIZE + MockExtension.size() + 5 + 3);
    EXPECT_EQ(std::vector<uint8_t>(buffer.end() - 3, buffer.end()), container.payload.bytes);
}

TEST_F(ContainerCodecTest, Deserialize_RestoresAllFields)
{
    Container restored = ContainerCodec::deserialize(ContainerCodec::serialize(container));

    EXPECT_EQ(restored.extension, MockExtension);
    EXPECT_EQ(restored.originalSize, MockInput.size());
    EXPECT_EQ(restored.payload.padding, container.payload.padding);
    EXPECT_EQ(restored.payload.bytes, container.payload.bytes);
    EXPECT_TRUE(restored.tree.sameShape(container.tree));
}

TEST_F(ContainerCodecTest, Deserialize_EmptyExtensionAndSingleLeafTree)
{
    Container single;
    single.originalSize = 3;
    single.tree.setRoot(single.tree.addLeaf(0x41, 3));
    single.payload.bytes = {0x00};
    single.payload.padding = 5;

    Container restored = ContainerCodec::deserialize(ContainerCodec::serialize(single));
    EXPECT_TRUE(restored.extension.empty());
    ASSERT_TRUE(restored.tree.isSingleLeaf());
    EXPECT_EQ(restored.tree.root().symbol, 0x41);
}

TEST_F(ContainerCodecTest, Deserialize_EmptyBuffer_Throws)
{
    EXPECT_THROW(ContainerCodec::deserialize({}), huffpack::InvalidFormatError);
}

TEST_F(ContainerCodecTest, Deserialize_WrongMarker_Throws)
{
    std::vector<uint8_t> buffer = ContainerCodec::serialize(container);
    buffer[0] = 'X';
    EXPECT_THROW(ContainerCodec::deserialize(buffer), huffpack::InvalidFormatError);
    EXPECT_THROW(ContainerCodec::deserialize(MockInput), huffpack::InvalidFormatError);
}

TEST_F(ContainerCodecTest, Deserialize_UnsupportedVersion_Throws)
{
    std::vector<uint8_t> buffer = ContainerCodec::serialize(container);
    buffer[4] = CONTAINER_VERSION + 1;
    EXPECT_THROW(ContainerCodec::deserialize(buffer), huffpack::InvalidFormatError);
}

TEST_F(ContainerCodecTest, Deserialize_TruncatedHeader_Throws)
{
    std::vector<uint8_t> buffer = ContainerCodec::serialize(container);
    for (size_t length : {3ul, 5ul, 8ul, 11ul, 16ul, paddingOffset()})
    {
        std::vector<uint8_t> truncated(buffer.begin(), buffer.begin() + length);
        EXPECT_THROW(ContainerCodec::deserialize(truncated), huffpack::InvalidFormatError) << "length " << length;
    }
}

TEST_F(ContainerCodecTest, Deserialize_ExtensionLengthPastEnd_Throws)
{
    std::vector<uint8_t> buffer = ContainerCodec::serialize(container);
    buffer[5] = 0xFF;
    buffer[6] = 0xFF;
    EXPECT_THROW(ContainerCodec::deserialize(buffer), huffpack::InvalidFormatError);
}

TEST_F(ContainerCodecTest, Deserialize_PaddingOutOfRange_Throws)
{
    std::vector<uint8_t> buffer = ContainerCodec::serialize(container);
    buffer[paddingOffset()] = 8;
    EXPECT_THROW(ContainerCodec::deserialize(buffer), huffpack::InvalidFormatError);
}

TEST_F(ContainerCodecTest, Deserialize_ZeroOriginalSize_Throws)
{
    std::vector<uint8_t> buffer = ContainerCodec::serialize(container);
    buffer[13] = 0;
    EXPECT_THROW(ContainerCodec::deserialize(buffer), huffpack::InvalidFormatError);
}

TEST_F(ContainerCodecTest, Deserialize_TruncatedTree_Throws)
{
    std::vector<uint8_t> buffer = ContainerCodec::serialize(container);
    std::vector<uint8_t> truncated(buffer.begin(), buffer.begin() + paddingOffset() + 3);
    EXPECT_THROW(ContainerCodec::deserialize(truncated), huffpack::InvalidFormatError);
}

TEST_F(ContainerCodecTest, Deserialize_NonZeroTreePadding_Throws)
{
    std::vector<uint8_t> buffer = ContainerCodec::serialize(container);
    buffer[paddingOffset() + 5] |= 0x01;    // last tree byte carries one filler bit
    EXPECT_THROW(ContainerCodec::deserialize(buffer), huffpack::InvalidFormatError);
}

TEST(ContainerTreeGrammarTest, DuplicateLeafSymbol_Throws)
{
    BitWriter writer;
    writer.writeBit(TREE_TAG_INTERNAL);
    writer.writeBit(TREE_TAG_LEAF);
    writer.writeBits('a', 8);
    writer.writeBit(TREE_TAG_LEAF);
    writer.writeBits('a', 8);
    uint8_t padding = 0;
    std::vector<uint8_t> bytes = writer.finish(padding);

    BitReader reader(bytes.data(), bytes.size() * 8);
    EXPECT_THROW(ContainerCodec::readTree(reader), huffpack::InvalidFormatError);
}

TEST(ContainerTreeGrammarTest, TooDeep_Throws)
{
    const std::vector<uint8_t> zeros(128, 0x00);   // 1024 internal tags
    BitReader reader(zeros.data(), zeros.size() * 8);
    EXPECT_THROW(ContainerCodec::readTree(reader), huffpack::InvalidFormatError);
}

TEST(ContainerTreeGrammarTest, WriteThenRead_KeepsShape)
{
    HuffmanTree tree = HuffmanTree::build(FrequencyAnalyzer::analyze(genRandomBinaryInput(4000)));

    BitWriter writer;
    ContainerCodec::writeTree(tree, writer);
    uint8_t padding = 0;
    std::vector<uint8_t> bytes = writer.finish(padding);

    BitReader reader(bytes.data(), bytes.size() * 8);
    HuffmanTree restored = ContainerCodec::readTree(reader);
    EXPECT_TRUE(restored.sameShape(tree));
    EXPECT_EQ(restored.leafCount(), tree.leafCount());
}

TEST(ContainerCodecErrorTest, CarriesDeserializationStage)
{
    try
    {
        ContainerCodec::deserialize(toBytes("not a container"));
        FAIL() << "expected InvalidFormatError";
    }
    catch (const huffpack::InvalidFormatError& e)
    {
        EXPECT_EQ(e.getStage(), huffpack::CodecStage::CONTAINER_DESERIALIZATION);
        EXPECT_EQ(e.getKind(), huffpack::ErrorKind::INVALID_FORMAT);
        EXPECT_NE(std::string(e.what()).find("container deserialization"), std::string::npos);
    }
}
