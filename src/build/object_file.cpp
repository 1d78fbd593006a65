//! # Native Object Inspection
//!
//! LLVM-C object API wrappers. Every LLVM handle is owned by a small RAII
//! guard so the early returns below cannot leak it.

#include "simdbuild/build/object_file.hpp"

#include <llvm-c/Core.h>
#include <llvm-c/Object.h>
#include <llvm-c/TargetMachine.h>

#include <memory>

namespace simdbuild::build {

namespace {

struct MessageDeleter {
    void operator()(char* msg) const {
        LLVMDisposeMessage(msg);
    }
};
using LlvmMessage = std::unique_ptr<char, MessageDeleter>;

struct BufferDeleter {
    void operator()(LLVMOpaqueMemoryBuffer* buf) const {
        LLVMDisposeMemoryBuffer(buf);
    }
};

struct BinaryDeleter {
    void operator()(LLVMOpaqueBinary* bin) const {
        LLVMDisposeBinary(bin);
    }
};

struct ContextDeleter {
    void operator()(LLVMOpaqueContext* ctx) const {
        LLVMContextDispose(ctx);
    }
};

struct SymbolIteratorDeleter {
    void operator()(LLVMOpaqueSymbolIterator* it) const {
        LLVMDisposeSymbolIterator(it);
    }
};

struct SectionIteratorDeleter {
    void operator()(LLVMOpaqueSectionIterator* it) const {
        LLVMDisposeSectionIterator(it);
    }
};

const char* object_format_name(LLVMBinaryType type) {
    switch (type) {
    case LLVMBinaryTypeCOFF:
        return "COFF";
    case LLVMBinaryTypeELF32L:
        return "ELF32L";
    case LLVMBinaryTypeELF32B:
        return "ELF32B";
    case LLVMBinaryTypeELF64L:
        return "ELF64L";
    case LLVMBinaryTypeELF64B:
        return "ELF64B";
    case LLVMBinaryTypeMachO32L:
        return "MachO32L";
    case LLVMBinaryTypeMachO32B:
        return "MachO32B";
    case LLVMBinaryTypeMachO64L:
        return "MachO64L";
    case LLVMBinaryTypeMachO64B:
        return "MachO64B";
    case LLVMBinaryTypeWasm:
        return "Wasm";
    default:
        return nullptr;
    }
}

} // namespace

auto read_object_symbols(const fs::path& path) -> Result<ObjectSymbols, std::string> {
    LLVMMemoryBufferRef raw_buffer = nullptr;
    char* raw_msg = nullptr;
    if (LLVMCreateMemoryBufferWithContentsOfFile(path.c_str(), &raw_buffer, &raw_msg)) {
        LlvmMessage msg(raw_msg);
        return std::string("cannot read ") + path.string() + ": " + (msg ? msg.get() : "unknown");
    }
    std::unique_ptr<LLVMOpaqueMemoryBuffer, BufferDeleter> buffer(raw_buffer);

    std::unique_ptr<LLVMOpaqueContext, ContextDeleter> context(LLVMContextCreate());

    raw_msg = nullptr;
    LLVMBinaryRef raw_binary = LLVMCreateBinary(buffer.get(), context.get(), &raw_msg);
    if (!raw_binary) {
        LlvmMessage msg(raw_msg);
        return path.string() + " is not a valid object file: " + (msg ? msg.get() : "unknown");
    }
    // Declared after `buffer` so it is destroyed first.
    std::unique_ptr<LLVMOpaqueBinary, BinaryDeleter> binary(raw_binary);

    const char* format = object_format_name(LLVMBinaryGetType(binary.get()));
    if (!format) {
        return path.string() + " is not a native object file";
    }

    ObjectSymbols out;
    out.format = format;

    std::unique_ptr<LLVMOpaqueSymbolIterator, SymbolIteratorDeleter> symbols(
        LLVMObjectFileCopySymbolIterator(binary.get()));
    std::unique_ptr<LLVMOpaqueSectionIterator, SectionIteratorDeleter> section(
        LLVMObjectFileCopySectionIterator(binary.get()));
    if (!symbols || !section) {
        return path.string() + ": cannot iterate symbols";
    }

    while (!LLVMObjectFileIsSymbolIteratorAtEnd(binary.get(), symbols.get())) {
        const char* name = LLVMGetSymbolName(symbols.get());
        if (name && name[0] != '\0' && name[0] != '.') {
            LLVMMoveToContainingSection(section.get(), symbols.get());
            if (!LLVMObjectFileIsSectionIteratorAtEnd(binary.get(), section.get())) {
                out.defined.emplace_back(name);
            }
        }
        LLVMMoveToNextSymbol(symbols.get());
    }
    return out;
}

auto default_target_triple() -> std::string {
    LlvmMessage triple(LLVMGetDefaultTargetTriple());
    return triple ? std::string(triple.get()) : std::string();
}

} // namespace simdbuild::build
