/*
 * DesignStudio.hpp
 *
 * Prompt, style and history bookkeeping around the design generator. The
 * generator itself is an external collaborator behind DesignGenerator; it is
 * called on a worker thread and its result is applied on the host thread.
 */
#ifndef DESIGN_STUDIO_HPP
#define DESIGN_STUDIO_HPP

#include <functional>
#include <future>
#include <memory>
#include <string>
#include <vector>

#include "common/Errors.hpp"
#include "common/TaskQueue.hpp"

enum class DesignStyle {
    FineLine,
    Traditional,
    Geometric,
    Watercolor,
    Dotwork,
    Realistic,
    Japanese,
    Cyberpunk
};

// In palette order, Fine Line first.
const std::vector<DesignStyle>& allStyles();
const char* styleName(DesignStyle style);
const char* styleDescription(DesignStyle style);
// Case-insensitive match on styleName.
bool parseStyle(const std::string& name, DesignStyle& style);

// Full generation prompt: stencil framing, style description and the
// isolation / composition requirements around the user's idea.
std::string buildPrompt(const std::string& prompt, DesignStyle style);

struct Design {
    std::string id;
    std::string url;  // data URI, remote URL or file path
    std::string prompt;
    DesignStyle style;
};

//! External design generator.
class DesignGenerator {
   public:
    virtual ~DesignGenerator() {}

    //! generate
    /*! Returns an image reference loadable by ImageLoader::decode. Throws
        GenerationFailure when no usable image is produced. Called from a
        worker thread. */
    virtual std::string generate(const std::string& prompt,
                                 DesignStyle style) = 0;
};

class DesignStudio {
   public:
    typedef std::function<void(const Design&)> SelectCallback;
    typedef std::function<void(const GenerationFailure&)> FailureCallback;

    // `generator` may be null; generation requests then fail.
    DesignStudio(TaskQueue& queue, std::shared_ptr<DesignGenerator> generator);
    ~DesignStudio();

    DesignStudio(const DesignStudio&) = delete;
    DesignStudio& operator=(const DesignStudio&) = delete;

    void setPrompt(const std::string& prompt);
    const std::string& prompt() const;
    void setStyle(DesignStyle style);
    DesignStyle style() const;

    //! requestGeneration
    /*! Starts generating the current prompt in the current style. Ignored
        (returns false) when the prompt is blank or a generation is already
        running. On success the design is prepended to the history and
        selected; on failure prompt and history are left as they were. */
    bool requestGeneration();
    bool generating() const;

    // Newest first. Starts with three sample designs.
    const std::vector<Design>& history() const;
    // Message of the last failed generation, empty after a success.
    const std::string& lastError() const;

    void setOnSelect(SelectCallback callback);
    void setOnFailure(FailureCallback callback);

   private:
    struct Shared {
        std::string prompt;
        DesignStyle style = DesignStyle::FineLine;
        bool generating = false;
        std::vector<Design> history;
        std::string lastError;
        SelectCallback onSelect;
        FailureCallback onFailure;
    };

    static void finish(const std::shared_ptr<Shared>& shared,
                       const Design& design, const std::string& failure);

    TaskQueue& queue_;
    std::shared_ptr<DesignGenerator> generator_;
    std::shared_ptr<Shared> shared_;
    std::future<void> worker_;
};

#endif
