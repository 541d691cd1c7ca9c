#include "batch_driver.hpp"
#include "language_detector.hpp"
#include "logging.hpp"
#include "minilm_embedder.hpp"
#include "outline_extractor.hpp"
#include "pdf_utils.hpp"
#include "section_extractor.hpp"
#include "string_utils.hpp"
#include "tesseract_ocr.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <fstream>
#include <map>
#include <memory>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

namespace {

double elapsed_seconds(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

}

bool write_file_atomically(const boost::filesystem::path& path, const std::string& content) {
    boost::filesystem::path temporary = path;
    temporary += ".tmp";

    {
        std::ofstream out(temporary.string(), std::ios::binary | std::ios::trunc);
        if (!out) {
            LOG_CHANNEL_ERROR("driver") << "cannot write " << temporary.string();
            return false;
        }
        out << content;
        if (!out.flush()) {
            LOG_CHANNEL_ERROR("driver") << "write to " << temporary.string() << " failed";
            out.close();
            boost::system::error_code ec;
            boost::filesystem::remove(temporary, ec);
            return false;
        }
    }

    boost::system::error_code ec;
    boost::filesystem::rename(temporary, path, ec);
    if (ec) {
        LOG_CHANNEL_ERROR("driver") << "cannot rename " << temporary.string() << ": " << ec.message();
        boost::filesystem::remove(temporary, ec);
        return false;
    }
    return true;
}

std::vector<boost::filesystem::path> list_pdf_files(const boost::filesystem::path& directory) {
    std::vector<boost::filesystem::path> files;

    boost::system::error_code ec;
    boost::filesystem::directory_iterator it(directory, ec);
    if (ec) {
        LOG_CHANNEL_ERROR("driver") << "cannot list " << directory.string() << ": " << ec.message();
        return files;
    }

    for (; it != boost::filesystem::directory_iterator(); ++it) {
        const boost::filesystem::path& path = it->path();
        if (boost::filesystem::is_regular_file(path, ec) && to_lower_copy(path.extension().string()) == ".pdf") {
            files.push_back(path);
        }
    }

    std::sort(files.begin(), files.end());
    return files;
}

bool process_outline_document(const boost::filesystem::path& pdf_path,
                              const boost::filesystem::path& output_dir,
                              const Batch_Options& options) {
    const auto start = std::chrono::steady_clock::now();

    std::unique_ptr<Tesseract_Ocr_Engine> ocr_engine;
    if (options.enable_ocr) {
        ocr_engine = std::make_unique<Tesseract_Ocr_Engine>(options.tessdata_path);
    }
    Stopword_Language_Detector language_detector;

    std::optional<Document_Outline> outline = extract_outline(pdf_path.string(), ocr_engine.get(), &language_detector, options.config);
    if (!outline) {
        LOG_CHANNEL_ERROR("driver") << pdf_path.filename().string() << ": cannot open document";
        return false;
    }

    boost::filesystem::path output_path = output_dir / pdf_path.stem();
    output_path += ".json";
    if (!write_file_atomically(output_path, format_document_outline(*outline))) {
        return false;
    }

    LOG_CHANNEL_INFO("driver") << pdf_path.filename().string() << " -> " << output_path.filename().string()
                               << " (" << outline->outline.size() << " headings) in " << elapsed_seconds(start) << "s";
    return true;
}

int run_outline_batch(const boost::filesystem::path& input_dir,
                      const boost::filesystem::path& output_dir,
                      const Batch_Options& options) {
    const auto start = std::chrono::steady_clock::now();

    std::vector<boost::filesystem::path> pdf_files = list_pdf_files(input_dir);
    if (pdf_files.empty()) {
        LOG_CHANNEL_ERROR("driver") << "no PDF files found in " << input_dir.string();
        return 1;
    }

    boost::system::error_code ec;
    boost::filesystem::create_directories(output_dir, ec);
    if (ec) {
        LOG_CHANNEL_ERROR("driver") << "cannot create " << output_dir.string() << ": " << ec.message();
        return 1;
    }

    LOG_CHANNEL_INFO("driver") << "processing " << pdf_files.size() << " documents with " << options.jobs << " workers";

    std::atomic<unsigned int> failures{0};
    boost::asio::thread_pool pool(std::max(1u, options.jobs));
    for (const boost::filesystem::path& pdf_path : pdf_files) {
        boost::asio::post(pool, [&pdf_path, &output_dir, &options, &failures]() {
            try {
                if (!process_outline_document(pdf_path, output_dir, options)) {
                    failures++;
                }
            } catch (const std::exception& e) {
                LOG_CHANNEL_ERROR("driver") << pdf_path.filename().string() << ": " << e.what();
                failures++;
            }
        });
    }
    pool.join();

    LOG_CHANNEL_INFO("driver") << pdf_files.size() - failures.load() << "/" << pdf_files.size()
                               << " documents processed in " << elapsed_seconds(start) << "s";
    return 0;
}

Outline_Item overview_heading(const std::string& document_name) {
    Outline_Item item;
    item.level = Heading_Level::H1;
    item.text = "Overview of " + boost::filesystem::path(document_name).stem().string();
    item.page = 1;
    item.position = 0;
    return item;
}

std::vector<Extracted_Section> rank_collection(const Collection_Request& request,
                                               const std::vector<Named_Document>& documents,
                                               const Semantic_Ranker& ranker,
                                               Ocr_Engine* ocr_engine,
                                               const Language_Detector* language_detector,
                                               const Outline_Config& config) {
    std::map<std::string, std::vector<Outline_Item>> outlines;
    std::map<std::string, const Document_Source*> sources;
    std::vector<Ranked_Section> all_sections;

    for (const Named_Document& document : documents) {
        LOG_CHANNEL_INFO("driver") << "extracting outline from " << document.first;
        Document_Outline outline = extract_outline(*document.second, ocr_engine, language_detector, config);
        if (outline.outline.empty()) {
            LOG_CHANNEL_WARNING("driver") << document.first << ": no headings detected, using an overview section";
            outline.outline.push_back(overview_heading(document.first));
        }

        for (const Outline_Item& item : outline.outline) {
            Ranked_Section section;
            section.item = item;
            section.document = document.first;
            all_sections.push_back(std::move(section));
        }
        outlines[document.first] = std::move(outline.outline);
        sources[document.first] = document.second;
    }

    std::vector<Ranked_Section> ranked = ranker.rank_sections(request.persona, request.job_to_be_done, std::move(all_sections));
    if (ranked.empty()) {
        LOG_CHANNEL_WARNING("driver") << "no ranked sections";
    }

    std::vector<Extracted_Section> sections;
    const size_t top = std::min<size_t>(ranked.size(), config.top_sections);
    for (size_t i = 0; i < top; ++i) {
        const Ranked_Section& section = ranked[i];
        LOG_CHANNEL_INFO("driver") << "extracting '" << section.item.text << "' from " << section.document
                                   << " (score " << section.relevance_score << ")";

        Extracted_Section extracted;
        extracted.document = section.document;
        extracted.section_title = section.item.text;
        extracted.importance_rank = static_cast<unsigned int>(i + 1);
        extracted.page_number = section.item.page;
        extracted.refined_text = extract_section_content(*sources.at(section.document), section.item, outlines.at(section.document));
        sections.push_back(std::move(extracted));
    }
    return sections;
}

int run_collection(const boost::filesystem::path& input_dir,
                   const boost::filesystem::path& output_dir,
                   const Batch_Options& options) {
    const auto start = std::chrono::steady_clock::now();

    const boost::filesystem::path input_path = input_dir / options.collection_input;
    std::optional<Collection_Request> request = load_collection_request(input_path.string());
    if (!request) {
        LOG_CHANNEL_ERROR("driver") << "cannot read collection input " << input_path.string();
        return 1;
    }
    LOG_CHANNEL_INFO("driver") << "persona: " << request->persona << ", task: " << request->job_to_be_done;

    // the opened documents must outlive the section extraction
    std::vector<std::unique_ptr<Mupdf_Document>> opened;
    std::vector<Named_Document> documents;
    for (const std::string& name : request->documents) {
        const boost::filesystem::path pdf_path = input_dir / name;
        if (!boost::filesystem::exists(pdf_path)) {
            LOG_CHANNEL_WARNING("driver") << "document " << name << " not found, skipping";
            continue;
        }

        std::unique_ptr<Mupdf_Document> document = open_pdf_document(pdf_path.string());
        if (!document) {
            LOG_CHANNEL_ERROR("driver") << name << ": cannot open document";
            continue;
        }
        documents.emplace_back(name, document.get());
        opened.push_back(std::move(document));
    }

    std::unique_ptr<Minilm_Embedder> embedder = std::make_unique<Minilm_Embedder>(options.config.embedding_max_length);
    if (!embedder->init(options.model_path, options.vocab_path)) {
        LOG_CHANNEL_ERROR("driver") << "embedding model unavailable, sections will not be ranked";
        embedder.reset();
    }
    Semantic_Ranker ranker(std::move(embedder));

    std::unique_ptr<Tesseract_Ocr_Engine> ocr_engine;
    if (options.enable_ocr) {
        ocr_engine = std::make_unique<Tesseract_Ocr_Engine>(options.tessdata_path);
    }
    Stopword_Language_Detector language_detector;

    Collection_Result result;
    result.request = *request;
    result.sections = rank_collection(*request, documents, ranker, ocr_engine.get(), &language_detector, options.config);
    result.processing_timestamp = utc_timestamp();

    boost::system::error_code ec;
    boost::filesystem::create_directories(output_dir, ec);
    if (ec) {
        LOG_CHANNEL_ERROR("driver") << "cannot create " << output_dir.string() << ": " << ec.message();
        return 1;
    }

    const boost::filesystem::path output_path = output_dir / options.collection_output;
    if (!write_file_atomically(output_path, format_collection_result(result))) {
        return 1;
    }

    LOG_CHANNEL_INFO("driver") << "collection processed in " << elapsed_seconds(start) << "s, output " << output_path.string();
    return 0;
}
