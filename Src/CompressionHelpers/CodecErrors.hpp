#pragma once
#ifndef HUFFPACK_CODEC_ERRORS_HPP
#define HUFFPACK_CODEC_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <unordered_map>
#include "../Helpers/Result.hpp"

namespace huffpack
{
    enum class CodecStage : size_t {
        FREQUENCY_ANALYSIS,
        TREE_CONSTRUCTION,
        CODE_GENERATION,
        BIT_PACKING,
        BIT_UNPACKING,
        CONTAINER_SERIALIZATION,
        CONTAINER_DESERIALIZATION
    };

    static const std::unordered_map<CodecStage, std::string> codecStageNames =
    {
        {CodecStage::FREQUENCY_ANALYSIS, "frequency analysis"},
        {CodecStage::TREE_CONSTRUCTION, "tree construction"},
        {CodecStage::CODE_GENERATION, "code generation"},
        {CodecStage::BIT_PACKING, "bit packing"},
        {CodecStage::BIT_UNPACKING, "bit unpacking"},
        {CodecStage::CONTAINER_SERIALIZATION, "container serialization"},
        {CodecStage::CONTAINER_DESERIALIZATION, "container deserialization"}
    };

    inline std::string codecStageToString(CodecStage stage)
    {
        return codecStageNames.at(stage);
    }

    // Base of every user-facing codec failure. what() is prefixed with the stage.
    class CodecError : public std::runtime_error
    {
      public:
        CodecError(CodecStage stage, ErrorKind kind, const std::string& message)
        : std::runtime_error(codecStageToString(stage) + ": " + message)
        , stage(stage)
        , kind(kind)
        {}

        CodecStage getStage() const { return stage; }
        ErrorKind getKind() const { return kind; }

      private:
        CodecStage stage;
        ErrorKind kind;
    };

    class EmptyInputError : public CodecError
    {
      public:
        explicit EmptyInputError(CodecStage stage)
        : CodecError(stage, ErrorKind::EMPTY_INPUT, "Input is empty")
        {}
    };

    class InvalidFormatError : public CodecError
    {
      public:
        explicit InvalidFormatError(const std::string& message)
        : CodecError(CodecStage::CONTAINER_DESERIALIZATION, ErrorKind::INVALID_FORMAT, message)
        {}
    };

    class CorruptPayloadError : public CodecError
    {
      public:
        explicit CorruptPayloadError(const std::string& message)
        : CodecError(CodecStage::BIT_UNPACKING, ErrorKind::CORRUPT_PAYLOAD, message)
        {}
    };
} // huffpack

#endif // HUFFPACK_CODEC_ERRORS_HPP
