#pragma once

#include "pdf_layout/document.h"
#include <memory>
#include <string>

namespace pdf_layout {

struct ExtractOptions {
    bool extract_images = true;
    bool preserve_ligatures = true;
    // Wrap each text block's words in a Paragraph instead of emitting bare words.
    bool group_paragraphs = false;
    int page_limit = 0;  // 0 = all pages
};

// Builds the initial document tree from a PDF with MuPDF. One instance owns
// one MuPDF context and must not be shared between threads.
class TextExtractor {
public:
    TextExtractor();
    ~TextExtractor();

    // Throws std::runtime_error when the file cannot be read.
    Document extract_document(const std::string& pdf_path,
                              const ExtractOptions& options = ExtractOptions{});

    // page_number is 1-based. Throws std::out_of_range past the last page.
    Page extract_page(const std::string& pdf_path, int page_number,
                      const ExtractOptions& options = ExtractOptions{});

    int get_page_count(const std::string& pdf_path);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace pdf_layout
