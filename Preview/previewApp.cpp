#include <glad/glad.h>
#include <GLFW/glfw3.h>

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <glm/gtc/type_ptr.hpp>
#include <iostream>
#include <memory>
#include <opencv2/core.hpp>
#include <sstream>
#include <string>

#include "imgui.h"
#include "imgui_impl_glfw.h"
#include "imgui_impl_opengl3.h"

#include "common/Errors.hpp"
#include "config/EngineConfig.hpp"
#include "generation/DesignStudio.hpp"
#include "session/PreviewSession.hpp"

#ifndef INKVISION_SHADER_DIR
#define INKVISION_SHADER_DIR "shaders"
#endif

using namespace std;

GLFWwindow* window;

// Helper function to initialize the window
bool initWindow(std::string windowName);

// --- State shared with the GLFW callbacks --------------------------------
static PreviewSession* g_session = nullptr;
// Where the composite is drawn, in window coordinates
static double g_viewX = 0.0, g_viewY = 0.0, g_viewW = 0.0, g_viewH = 0.0;
static const int kMousePointerId = 0;

static bool insideView(double x, double y) {
    return x >= g_viewX && y >= g_viewY && x < g_viewX + g_viewW &&
           y < g_viewY + g_viewH;
}

static PointerEvent mouseEvent(GLFWwindow* win, double x, double y) {
    PointerEvent ev;
    ev.id = kMousePointerId;
    ev.primary = true;
    ev.x = x - g_viewX;
    ev.y = y - g_viewY;
    // If shift is held, horizontal drag rotates
    ev.rotate = glfwGetKey(win, GLFW_KEY_LEFT_SHIFT) == GLFW_PRESS ||
                glfwGetKey(win, GLFW_KEY_RIGHT_SHIFT) == GLFW_PRESS;
    return ev;
}

// GLFW callbacks. Installed before ImGui, which chains to them.
static void scroll_callback(GLFWwindow* win, double xoffset, double yoffset) {
    if (!g_session || ImGui::GetIO().WantCaptureMouse) return;
    double mx, my;
    glfwGetCursorPos(win, &mx, &my);
    if (!insideView(mx, my)) return;
    g_session->wheel(yoffset);
}

static void mouse_button_callback(GLFWwindow* win, int button, int action,
                                  int mods) {
    if (!g_session || button != GLFW_MOUSE_BUTTON_LEFT) return;
    double mx, my;
    glfwGetCursorPos(win, &mx, &my);
    PointerEvent ev = mouseEvent(win, mx, my);
    if (action == GLFW_PRESS) {
        if (ImGui::GetIO().WantCaptureMouse || !insideView(mx, my)) return;
        g_session->pointerDown(ev);
    } else if (action == GLFW_RELEASE) {
        g_session->pointerUp(ev);
    }
}

static void cursor_pos_callback(GLFWwindow* win, double xpos, double ypos) {
    if (!g_session) return;
    PointerEvent ev = mouseEvent(win, xpos, ypos);
    // Leaving the image (into the letterbox bars) ends the drag
    if (g_session->gestures().dragging() && !insideView(xpos, ypos)) {
        g_session->pointerLeave(ev);
        return;
    }
    g_session->pointerMove(ev);
}

static void cursor_enter_callback(GLFWwindow* win, int entered) {
    if (!g_session || entered) return;
    double mx, my;
    glfwGetCursorPos(win, &mx, &my);
    g_session->pointerLeave(mouseEvent(win, mx, my));
}

// Helper to load shader source from file
static std::string loadShaderSource(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "[Preview] Failed to open shader file: " << path << "\n";
        return std::string();
    }
    std::stringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

// Compile Shader Helper
static GLuint compileShader(GLenum type, const char* src) {
    GLuint shader = glCreateShader(type);
    glShaderSource(shader, 1, &src, nullptr);
    glCompileShader(shader);
    GLint success;
    glGetShaderiv(shader, GL_COMPILE_STATUS, &success);
    if (!success) {
        char infoLog[512];
        glGetShaderInfoLog(shader, 512, nullptr, infoLog);
        std::cerr << "[Preview] Shader compile error: " << infoLog << "\n";
    }
    return shader;
}

// Create Shader Program. Returns 0 if linking failed.
static GLuint createShaderProgram(const char* vertexSrc,
                                  const char* fragmentSrc) {
    GLuint vertex = compileShader(GL_VERTEX_SHADER, vertexSrc);
    GLuint fragment = compileShader(GL_FRAGMENT_SHADER, fragmentSrc);
    GLuint program = glCreateProgram();
    glAttachShader(program, vertex);
    glAttachShader(program, fragment);
    glLinkProgram(program);

    GLint success;
    glGetProgramiv(program, GL_LINK_STATUS, &success);
    if (!success) {
        char infoLog[512];
        glGetProgramInfoLog(program, 512, nullptr, infoLog);
        std::cerr << "[Preview] Program link error: " << infoLog << "\n";
        glDeleteProgram(program);
        program = 0;
    }

    glDeleteShader(vertex);
    glDeleteShader(fragment);
    return program;
}

// Uploads an 8-bit BGRA composite into `texture`.
static void uploadComposite(GLuint texture, const cv::Mat& composite) {
    cv::Mat pixels =
        composite.isContinuous() ? composite : composite.clone();
    glBindTexture(GL_TEXTURE_2D, texture);
    glPixelStorei(GL_UNPACK_ALIGNMENT, 4);
    glTexImage2D(GL_TEXTURE_2D, 0, GL_RGBA8, pixels.cols, pixels.rows, 0,
                 GL_BGRA, GL_UNSIGNED_BYTE, pixels.data);
}

// Largest rectangle with the composite's aspect ratio centered in the window.
static void letterbox(int winW, int winH, int imgW, int imgH) {
    if (winW <= 0 || winH <= 0 || imgW <= 0 || imgH <= 0) {
        g_viewX = g_viewY = g_viewW = g_viewH = 0.0;
        return;
    }
    double s = std::min((double)winW / imgW, (double)winH / imgH);
    g_viewW = imgW * s;
    g_viewH = imgH * s;
    g_viewX = (winW - g_viewW) * 0.5;
    g_viewY = (winH - g_viewH) * 0.5;
}

static void printUsage(const char* argv0) {
    cout << "Usage: " << argv0
         << " [--photo <src>] [--design <src>] [--config <file.yml>]\n"
            "       [--scale f] [--rotation deg] [--opacity f]\n"
            "       [--offsetX px] [--offsetY px] [--blend mode]\n"
            "       [--hue deg] [--saturation pct] [--brightness pct]\n"
            "       [--export <out.png>]\n"
            "A source is a file path, a data: URI or an http(s) URL.\n";
}

// Renders once without a window and writes the PNG.
static int runHeadless(const EngineConfig& config, const std::string& photo,
                       const std::string& design, const std::string& out) {
    if (photo.empty()) {
        cerr << "[Preview] --export needs --photo" << endl;
        return 2;
    }
    PreviewSession session(config);
    int failures = 0;
    session.setOnLoadError(
        [&failures](Slot, const DecodeError&) { failures++; });
    session.setPhoto(photo);
    if (!design.empty()) session.selectDesign(design);

    if (!session.waitIdle(std::chrono::seconds(60))) {
        cerr << "[Preview] Timed out waiting for images" << endl;
        return 1;
    }
    if (failures > 0) return 1;

    try {
        Export::EncodedImage image = session.exportCurrent();
        if (!image.writeToFile(out)) {
            cerr << "[Preview] Could not write '" << out << "'" << endl;
            return 1;
        }
        cout << "[Preview] Wrote " << out << " (" << image.width << "x"
             << image.height << ")" << endl;
    } catch (const ExportError& e) {
        cerr << "[Preview] " << e.what() << endl;
        return 1;
    }
    return 0;
}

// Slider helper: pushes a single-field patch when the widget changed.
static void sliderField(const char* label, float value, float lo, float hi,
                        const char* fmt,
                        OverlayPatch& (OverlayPatch::*setter)(float)) {
    if (ImGui::SliderFloat(label, &value, lo, hi, fmt))
        g_session->update((OverlayPatch().*setter)(value));
}

/* ------------------------------------------------------------------------- */
/* main                                                                      */
/* ------------------------------------------------------------------------- */
int main(int argc, char** argv) {
    std::string photoArg, designArg, configArg, exportArg;
    // Flags applied over the configuration defaults
    OverlayPatch preset;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string a = argv[i];
            if (a == "--help" || a == "-h") {
                printUsage(argv[0]);
                return 0;
            } else if (a == "--photo" && i + 1 < argc)
                photoArg = argv[++i];
            else if (a == "--design" && i + 1 < argc)
                designArg = argv[++i];
            else if (a == "--config" && i + 1 < argc)
                configArg = argv[++i];
            else if (a == "--export" && i + 1 < argc)
                exportArg = argv[++i];
            else if (a == "--scale" && i + 1 < argc)
                preset.scale(std::stof(argv[++i]));
            else if (a == "--rotation" && i + 1 < argc)
                preset.rotation(std::stof(argv[++i]));
            else if (a == "--opacity" && i + 1 < argc)
                preset.opacity(std::stof(argv[++i]));
            else if (a == "--offsetX" && i + 1 < argc)
                preset.offsetX(std::stof(argv[++i]));
            else if (a == "--offsetY" && i + 1 < argc)
                preset.offsetY(std::stof(argv[++i]));
            else if (a == "--hue" && i + 1 < argc)
                preset.hue(std::stof(argv[++i]));
            else if (a == "--saturation" && i + 1 < argc)
                preset.saturation(std::stof(argv[++i]));
            else if (a == "--brightness" && i + 1 < argc)
                preset.brightness(std::stof(argv[++i]));
            else if (a == "--blend" && i + 1 < argc) {
                BlendMode mode;
                if (!parseBlendMode(argv[++i], mode)) {
                    cerr << "Unknown blend mode: " << argv[i] << endl;
                    return 2;
                }
                preset.blendMode(mode);
            } else {
                cerr << "Unknown or incomplete option: " << a << endl;
                printUsage(argv[0]);
                return 2;
            }
        }
    } catch (const std::exception& e) {
        cerr << "Invalid number on the command line (" << e.what() << ")"
             << endl;
        return 2;
    }

    EngineConfig config;
    if (!configArg.empty() && !loadEngineConfig(configArg, config)) return 2;
    // Command line wins over the file. Kept as defaults so that a new photo
    // resets to them.
    config.defaults = applyPatch(config.defaults, preset, config.limits);

    if (!exportArg.empty())
        return runHeadless(config, photoArg, designArg, exportArg);

    // Initialize OpenGL context
    if (!initWindow("InkVision Preview")) return -1;

    if (!gladLoadGLLoader((GLADloadproc)glfwGetProcAddress)) {
        cerr << "Failed to initialize GLAD" << endl;
        glfwTerminate();
        return -1;
    }

    PreviewSession session(config);
    g_session = &session;
    std::string status = "Load a photo to start";
    session.setOnLoadError([&status](Slot, const DecodeError& e) {
        status = e.what();
    });

    // No generator client is linked into the preview; requests report it.
    DesignStudio studio(session.queue(), std::shared_ptr<DesignGenerator>());
    studio.setOnSelect(
        [&session](const Design& d) { session.selectDesign(d.url); });
    studio.setOnFailure(
        [&status](const GenerationFailure& e) { status = e.what(); });

    glfwSetInputMode(window, GLFW_STICKY_KEYS, GL_TRUE);
    glfwSetScrollCallback(window, scroll_callback);
    glfwSetMouseButtonCallback(window, mouse_button_callback);
    glfwSetCursorPosCallback(window, cursor_pos_callback);
    glfwSetCursorEnterCallback(window, cursor_enter_callback);
    glClearColor(0.1f, 0.1f, 0.12f, 0.0f);

    // --- Setup Dear ImGui context ---
    const char* glsl_version = "#version 330 core";
    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();
    ImGui::StyleColorsDark();
    ImGui_ImplGlfw_InitForOpenGL(window, true);
    ImGui_ImplOpenGL3_Init(glsl_version);

    // --- Composite texture ---
    GLuint compositeTex;
    glGenTextures(1, &compositeTex);
    glBindTexture(GL_TEXTURE_2D, compositeTex);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_LINEAR);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_LINEAR);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);
    int texW = 0, texH = 0;

    session.setOnRender([&](const cv::Mat& composite) {
        texW = composite.cols;
        texH = composite.rows;
        if (!composite.empty()) uploadComposite(compositeTex, composite);
    });

    // --- Unit quad, top-left origin, row 0 of the composite at the top ---
    float vertices[] = {
        // positions   // tex coords
        0.f, 0.f, 0.f, 0.f,  // top-left
        0.f, 1.f, 0.f, 1.f,  // bottom-left
        1.f, 1.f, 1.f, 1.f,  // bottom-right
        1.f, 0.f, 1.f, 0.f   // top-right
    };
    unsigned int indices[] = {0, 1, 2, 0, 2, 3};

    GLuint VAO, VBO, EBO;
    glGenVertexArrays(1, &VAO);
    glGenBuffers(1, &VBO);
    glGenBuffers(1, &EBO);
    glBindVertexArray(VAO);
    glBindBuffer(GL_ARRAY_BUFFER, VBO);
    glBufferData(GL_ARRAY_BUFFER, sizeof(vertices), vertices, GL_STATIC_DRAW);
    glBindBuffer(GL_ELEMENT_ARRAY_BUFFER, EBO);
    glBufferData(GL_ELEMENT_ARRAY_BUFFER, sizeof(indices), indices,
                 GL_STATIC_DRAW);
    // position attribute
    glVertexAttribPointer(0, 2, GL_FLOAT, GL_FALSE, 4 * sizeof(float),
                          (void*)0);
    glEnableVertexAttribArray(0);
    // texcoord attribute
    glVertexAttribPointer(1, 2, GL_FLOAT, GL_FALSE, 4 * sizeof(float),
                          (void*)(2 * sizeof(float)));
    glEnableVertexAttribArray(1);
    glBindVertexArray(0);

    std::string shaderDir = INKVISION_SHADER_DIR;
    std::string quadVertSrc = loadShaderSource(shaderDir + "/previewQuad.vert");
    std::string quadFragSrc = loadShaderSource(shaderDir + "/previewQuad.frag");
    if (quadVertSrc.empty() || quadFragSrc.empty()) {
        cerr << "Failed to load preview shaders." << endl;
        glfwTerminate();
        return -1;
    }
    GLuint quadProgram =
        createShaderProgram(quadVertSrc.c_str(), quadFragSrc.c_str());
    if (quadProgram == 0) {
        glfwTerminate();
        return -1;
    }
    glUseProgram(quadProgram);
    glUniform1i(glGetUniformLocation(quadProgram, "compositeTex"), 0);
    GLint projLoc = glGetUniformLocation(quadProgram, "projection");
    GLint modelLoc = glGetUniformLocation(quadProgram, "model");

    if (!photoArg.empty()) session.setPhoto(photoArg);
    if (!designArg.empty()) session.selectDesign(designArg);

    // Text buffers for the panel
    char photoBuf[1024] = {0};
    char designBuf[1024] = {0};
    char promptBuf[512] = {0};
    photoArg.copy(photoBuf, sizeof(photoBuf) - 1);
    designArg.copy(designBuf, sizeof(designBuf) - 1);

    cout << "Drag moves the design, Shift+drag rotates, scroll zooms. "
            "R = reset transform, ESC = quit"
         << endl;

    const int keysToWatch[] = {GLFW_KEY_R};
    bool prevKeyState[sizeof(keysToWatch) / sizeof(keysToWatch[0])] = {false};

    // --- Main Loop ---
    while (!glfwWindowShouldClose(window)) {
        glfwPollEvents();

        // Keys (edge triggered)
        if (!io.WantCaptureKeyboard) {
            for (size_t k = 0; k < sizeof(keysToWatch) / sizeof(keysToWatch[0]);
                 ++k) {
                bool down = glfwGetKey(window, keysToWatch[k]) == GLFW_PRESS;
                if (down && !prevKeyState[k] && keysToWatch[k] == GLFW_KEY_R)
                    session.reset(kFieldTransform);
                prevKeyState[k] = down;
            }
            if (glfwGetKey(window, GLFW_KEY_ESCAPE) == GLFW_PRESS)
                glfwSetWindowShouldClose(window, 1);
        }

        // Loads, generations and renders queued since the last frame
        session.runPending();

        int winW, winH, fbW, fbH;
        glfwGetWindowSize(window, &winW, &winH);
        glfwGetFramebufferSize(window, &fbW, &fbH);
        letterbox(winW, winH, texW, texH);
        session.setDisplaySize(g_viewW, g_viewH);

        // Start the Dear ImGui frame
        ImGui_ImplOpenGL3_NewFrame();
        ImGui_ImplGlfw_NewFrame();
        ImGui::NewFrame();

        ImGui::SetNextWindowBgAlpha(0.6f);
        ImGui::SetNextWindowPos(ImVec2(10.0f, 10.0f), ImGuiCond_FirstUseEver);
        ImGui::Begin("InkVision", nullptr,
                     ImGuiWindowFlags_AlwaysAutoResize);
        {
            ImGui::InputText("Photo", photoBuf, sizeof(photoBuf));
            if (ImGui::Button("Load photo") && photoBuf[0] != '\0')
                session.setPhoto(photoBuf);
            ImGui::SameLine();
            if (ImGui::Button("Clear photo")) session.clearPhoto();

            ImGui::InputText("Design", designBuf, sizeof(designBuf));
            if (ImGui::Button("Load design") && designBuf[0] != '\0')
                session.selectDesign(designBuf);
            ImGui::SameLine();
            if (ImGui::Button("Clear design")) session.clearDesign();

            if (session.loading()) ImGui::TextUnformatted("Loading...");

            if (ImGui::CollapsingHeader("Design Studio")) {
                if (ImGui::InputText("Idea", promptBuf, sizeof(promptBuf)))
                    studio.setPrompt(promptBuf);
                if (ImGui::BeginCombo("Style", styleName(studio.style()))) {
                    for (DesignStyle s : allStyles()) {
                        if (ImGui::Selectable(styleName(s),
                                              s == studio.style()))
                            studio.setStyle(s);
                    }
                    ImGui::EndCombo();
                }
                ImGui::TextWrapped("%s", styleDescription(studio.style()));
                if (studio.generating()) {
                    ImGui::TextUnformatted("Generating...");
                } else if (ImGui::Button("Generate")) {
                    studio.requestGeneration();
                }
                if (!studio.lastError().empty())
                    ImGui::TextWrapped("%s", studio.lastError().c_str());
                ImGui::Separator();
                for (const Design& d : studio.history()) {
                    std::string label = d.prompt + " (" + styleName(d.style) +
                                        ")##" + d.id;
                    if (ImGui::Selectable(label.c_str()))
                        session.selectDesign(d.url);
                }
            }

            ImGui::Separator();
            const OverlayConfig& o = session.overlay();
            const StateLimits& limits = session.state().limits();
            if (ImGui::Button("-")) session.adjustScale(-config.scaleStep);
            ImGui::SameLine();
            if (ImGui::Button("+")) session.adjustScale(config.scaleStep);
            ImGui::SameLine();
            sliderField("Scale", o.scale, limits.scaleMin, limits.scaleMax,
                        "%.2f", &OverlayPatch::scale);
            sliderField("Rotation", o.rotation, StateLimits::kRotationMin,
                        StateLimits::kRotationMax, "%.0f deg",
                        &OverlayPatch::rotation);
            sliderField("Opacity", o.opacity, StateLimits::kOpacityMin,
                        StateLimits::kOpacityMax, "%.2f",
                        &OverlayPatch::opacity);

            float offset[2] = {o.offsetX, o.offsetY};
            if (ImGui::DragFloat2("Offset", offset, 1.0f))
                session.update(OverlayPatch().offset(offset[0], offset[1]));

            if (ImGui::BeginCombo("Blend", blendModeName(o.blendMode))) {
                const BlendMode modes[] = {BlendMode::Multiply,
                                           BlendMode::Screen,
                                           BlendMode::Overlay,
                                           BlendMode::Darken,
                                           BlendMode::Normal};
                for (BlendMode m : modes) {
                    if (ImGui::Selectable(blendModeName(m), m == o.blendMode))
                        session.update(OverlayPatch().blendMode(m));
                }
                ImGui::EndCombo();
            }

            sliderField("Hue", o.hue, 0.0f, 359.0f, "%.0f deg",
                        &OverlayPatch::hue);
            sliderField("Saturation", o.saturation, StateLimits::kPercentMin,
                        StateLimits::kPercentMax, "%.0f %%",
                        &OverlayPatch::saturation);
            sliderField("Brightness", o.brightness, StateLimits::kPercentMin,
                        StateLimits::kPercentMax, "%.0f %%",
                        &OverlayPatch::brightness);

            if (ImGui::Button("Reset transform"))
                session.reset(kFieldTransform);
            ImGui::SameLine();
            if (ImGui::Button("Reset color")) session.reset(kFieldColor);

            ImGui::Separator();
            if (ImGui::Button("Export PNG")) {
                try {
                    Export::EncodedImage image = session.exportCurrent();
                    std::string name = session.downloadName();
                    if (image.writeToFile(name))
                        status = "Saved " + name;
                    else
                        status = "Could not write " + name;
                } catch (const ExportError& e) {
                    status = e.what();
                }
            }
            ImGui::TextWrapped("%s", status.c_str());
        }
        ImGui::End();

        // --- Draw ---
        glViewport(0, 0, fbW, fbH);
        glClear(GL_COLOR_BUFFER_BIT);
        if (texW > 0 && texH > 0 && g_viewW > 0.0) {
            glm::mat4 projection =
                glm::ortho(0.0f, (float)winW, (float)winH, 0.0f);
            glm::mat4 model = glm::translate(
                glm::mat4(1.0f),
                glm::vec3((float)g_viewX, (float)g_viewY, 0.0f));
            model = glm::scale(model,
                               glm::vec3((float)g_viewW, (float)g_viewH, 1.0f));

            glUseProgram(quadProgram);
            glUniformMatrix4fv(projLoc, 1, GL_FALSE,
                               glm::value_ptr(projection));
            glUniformMatrix4fv(modelLoc, 1, GL_FALSE, glm::value_ptr(model));
            glActiveTexture(GL_TEXTURE0);
            glBindTexture(GL_TEXTURE_2D, compositeTex);
            glBindVertexArray(VAO);
            glDrawElements(GL_TRIANGLES, 6, GL_UNSIGNED_INT, 0);
            glBindVertexArray(0);
        }

        ImGui::Render();
        ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
        glfwSwapBuffers(window);
    }

    // Cleanup
    g_session = nullptr;
    ImGui_ImplOpenGL3_Shutdown();
    ImGui_ImplGlfw_Shutdown();
    ImGui::DestroyContext();
    glDeleteVertexArrays(1, &VAO);
    glDeleteBuffers(1, &VBO);
    glDeleteBuffers(1, &EBO);
    glDeleteTextures(1, &compositeTex);
    glDeleteProgram(quadProgram);
    glfwTerminate();
    return 0;
}

/* ------------------------------------------------------------------------- */
/* Helper: initWindow (GLFW)                                                 */
/* ------------------------------------------------------------------------- */
bool initWindow(std::string windowName) {
    if (!glfwInit()) {
        fprintf(stderr, "Failed to initialize GLFW\n");
        return false;
    }
    glfwWindowHint(GLFW_SAMPLES, 4);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
    glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GL_TRUE);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
    window = glfwCreateWindow(1280, 800, windowName.c_str(), NULL, NULL);
    if (window == NULL) {
        fprintf(stderr, "Failed to open GLFW window.\n");
        glfwTerminate();
        return false;
    }
    glfwMakeContextCurrent(window);
    glfwSwapInterval(1);
    return true;
}
