#include "pdf_layout/text_extractor.h"
#include <mupdf/fitz.h>
#include <algorithm>
#include <memory>
#include <stdexcept>
#include <vector>

namespace pdf_layout {

namespace {

bool is_separator(int rune) {
    return rune == ' ' || rune == '\t' || rune == '\n' || rune == '\r' || rune == 0xA0;
}

bool is_dropped(int rune) {
    return rune == 0x200B;  // zero width space
}

BoundingBox to_box(const fz_rect& rect) {
    return BoundingBox::from_corners(rect.x0, rect.y0, rect.x1, rect.y1);
}

} // namespace

class TextExtractor::Impl {
public:
    Impl() {
        ctx = fz_new_context(NULL, NULL, FZ_STORE_UNLIMITED);
        if (!ctx) {
            throw std::runtime_error("Failed to create MuPDF context");
        }
        fz_register_document_handlers(ctx);
    }

    ~Impl() {
        if (ctx) {
            fz_drop_context(ctx);
        }
    }

    Page extract_page(const std::string& pdf_path, int page_number, const ExtractOptions& options) {
        DocumentHandle doc = open_document(pdf_path);
        return load_page(doc.get(), pdf_path, page_number, count_pages(doc.get(), pdf_path), options);
    }

    Document extract_document(const std::string& pdf_path, const ExtractOptions& options) {
        DocumentHandle doc = open_document(pdf_path);
        const int total = count_pages(doc.get(), pdf_path);
        int page_count = total;
        if (options.page_limit > 0) {
            page_count = std::min(page_count, options.page_limit);
        }

        std::vector<Page> pages;
        pages.reserve(page_count);
        for (int i = 1; i <= page_count; ++i) {
            pages.push_back(load_page(doc.get(), pdf_path, i, total, options));
        }

        return Document(std::move(pages), pdf_path);
    }

    int get_page_count(const std::string& pdf_path) {
        DocumentHandle doc = open_document(pdf_path);
        return count_pages(doc.get(), pdf_path);
    }

private:
    struct DocumentDropper {
        fz_context *ctx;
        void operator()(fz_document *doc) const { fz_drop_document(ctx, doc); }
    };
    using DocumentHandle = std::unique_ptr<fz_document, DocumentDropper>;

    DocumentHandle open_document(const std::string& pdf_path) {
        fz_document *doc = nullptr;
        fz_var(doc);

        fz_try(ctx) {
            doc = fz_open_document(ctx, pdf_path.c_str());
        }
        fz_catch(ctx) {
            throw std::runtime_error("MuPDF error opening " + pdf_path + ": " + fz_caught_message(ctx));
        }
        return DocumentHandle(doc, DocumentDropper{ctx});
    }

    int count_pages(fz_document *doc, const std::string& pdf_path) {
        int page_count = 0;
        fz_try(ctx) {
            page_count = fz_count_pages(ctx, doc);
        }
        fz_catch(ctx) {
            throw std::runtime_error("MuPDF error counting pages of " + pdf_path + ": " +
                                     fz_caught_message(ctx));
        }
        return page_count;
    }

    Page load_page(fz_document *doc, const std::string& pdf_path, int page_number, int page_count,
                   const ExtractOptions& options) {
        if (page_number < 1 || page_number > page_count) {
            throw std::out_of_range("Page " + std::to_string(page_number) + " out of range (1-" +
                                    std::to_string(page_count) + ") in " + pdf_path);
        }

        fz_page *page = nullptr;
        fz_stext_page *stext = nullptr;
        fz_rect bounds = fz_empty_rect;

        fz_var(page);
        fz_var(stext);

        fz_stext_options opts = { 0 };
        if (options.preserve_ligatures) {
            opts.flags |= FZ_STEXT_PRESERVE_LIGATURES;
        }
        if (options.extract_images) {
            opts.flags |= FZ_STEXT_PRESERVE_IMAGES;
        }

        fz_try(ctx) {
            page = fz_load_page(ctx, doc, page_number - 1);
            bounds = fz_bound_page(ctx, page);
            stext = fz_new_stext_page_from_page(ctx, page, &opts);
        }
        fz_always(ctx) {
            if (page) fz_drop_page(ctx, page);
        }
        fz_catch(ctx) {
            if (stext) fz_drop_stext_page(ctx, stext);
            throw std::runtime_error(std::string("MuPDF error during text extraction: ") +
                                     fz_caught_message(ctx));
        }

        // The structured text outlives the page; convert it outside the MuPDF error scope.
        auto drop_stext = [this](fz_stext_page *p) { fz_drop_stext_page(ctx, p); };
        std::unique_ptr<fz_stext_page, decltype(drop_stext)> stext_guard(stext, drop_stext);

        return Page(page_number, to_box(bounds), stext_to_elements(stext, options));
    }

    std::vector<ElementPtr> stext_to_elements(fz_stext_page *stext, const ExtractOptions& options) {
        std::vector<ElementPtr> elements;

        for (fz_stext_block *block = stext->first_block; block; block = block->next) {
            if (block->type == FZ_STEXT_BLOCK_IMAGE) {
                elements.push_back(std::make_unique<Image>(to_box(block->bbox), std::string()));
                continue;
            }
            if (block->type != FZ_STEXT_BLOCK_TEXT) {
                continue;
            }

            std::vector<std::unique_ptr<Word>> words;
            for (fz_stext_line *line = block->u.t.first_line; line; line = line->next) {
                std::vector<std::unique_ptr<Character>> pending;
                for (fz_stext_char *ch = line->first_char; ch; ch = ch->next) {
                    if (is_dropped(ch->c)) {
                        continue;
                    }
                    if (is_separator(ch->c)) {
                        flush_word(pending, words);
                        continue;
                    }
                    pending.push_back(to_character(ch));
                }
                flush_word(pending, words);
            }

            if (words.empty()) {
                continue;
            }
            if (options.group_paragraphs) {
                elements.push_back(std::make_unique<Paragraph>(std::move(words)));
            } else {
                for (auto& word : words) {
                    elements.push_back(std::move(word));
                }
            }
        }

        return elements;
    }

    static void flush_word(std::vector<std::unique_ptr<Character>>& pending,
                           std::vector<std::unique_ptr<Word>>& words) {
        if (pending.empty()) {
            return;
        }
        words.push_back(std::make_unique<Word>(std::move(pending)));
        pending.clear();
    }

    std::unique_ptr<Character> to_character(fz_stext_char *ch) {
        char utf8[8] = {0};
        int len = fz_runetochar(utf8, ch->c);
        utf8[len] = 0;

        return std::make_unique<Character>(to_box(fz_rect_from_quad(ch->quad)),
                                           std::string(utf8), to_font(ch));
    }

    Font to_font(fz_stext_char *ch) {
        Font font;
        font.size = ch->size;
        if (!ch->font) {
            return font;
        }
        const char *name = fz_font_name(ctx, ch->font);
        font.name = name ? name : "unknown";
        font.weight = fz_font_is_bold(ctx, ch->font) ? FontWeight::BOLD : FontWeight::NORMAL;
        font.italic = fz_font_is_italic(ctx, ch->font) != 0;
        return font;
    }

    fz_context *ctx;
};

TextExtractor::TextExtractor() : pImpl(std::make_unique<Impl>()) {}
TextExtractor::~TextExtractor() = default;

Document TextExtractor::extract_document(const std::string& pdf_path, const ExtractOptions& options) {
    return pImpl->extract_document(pdf_path, options);
}

Page TextExtractor::extract_page(const std::string& pdf_path, int page_number,
                                 const ExtractOptions& options) {
    return pImpl->extract_page(pdf_path, page_number, options);
}

int TextExtractor::get_page_count(const std::string& pdf_path) {
    return pImpl->get_page_count(pdf_path);
}

} // namespace pdf_layout
