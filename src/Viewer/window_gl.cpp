#include "Viewer/core.hpp"
#include "Viewer/ViewerInternal.hpp"

#include <algorithm>
#include <cstddef>

// pos2 + color4, already in clip space
static const char* kVertexShader = R"GLSL(
    #version 330 core
    layout(location = 0) in vec2 aPos;
    layout(location = 1) in vec4 aColor;
    out vec4 vColor;
    void main() {
        vColor = aColor;
        gl_Position = vec4(aPos, 0.0, 1.0);
    }
)GLSL";

static const char* kFragmentShader = R"GLSL(
    #version 330 core
    in vec4 vColor;
    out vec4 FragColor;
    void main() {
        FragColor = vColor;
    }
)GLSL";

// 0 on failure, the log goes to stderr
static GLuint CompileStage_(GLenum type, const char* src, const char* name)
{
    GLuint shader = glCreateShader(type);
    glShaderSource(shader, 1, &src, nullptr);
    glCompileShader(shader);

    GLint ok = 0;
    glGetShaderiv(shader, GL_COMPILE_STATUS, &ok);
    if (ok) return shader;

    char log[1024];
    glGetShaderInfoLog(shader, sizeof(log), nullptr, log);
    std::cerr << name << " shader failed to compile: " << log << "\n";
    glDeleteShader(shader);
    return 0;
}

static GLuint BuildCellProgram_()
{
    const GLuint vs = CompileStage_(GL_VERTEX_SHADER, kVertexShader, "vertex");
    const GLuint fs = CompileStage_(GL_FRAGMENT_SHADER, kFragmentShader, "fragment");

    GLuint prog = 0;
    if (vs && fs)
    {
        prog = glCreateProgram();
        glAttachShader(prog, vs);
        glAttachShader(prog, fs);
        glLinkProgram(prog);

        GLint ok = 0;
        glGetProgramiv(prog, GL_LINK_STATUS, &ok);
        if (!ok)
        {
            char log[1024];
            glGetProgramInfoLog(prog, sizeof(log), nullptr, log);
            std::cerr << "shader program failed to link: " << log << "\n";
            glDeleteProgram(prog);
            prog = 0;
        }
    }

    if (vs) glDeleteShader(vs);
    if (fs) glDeleteShader(fs);

    if (!prog)
        throw std::runtime_error("could not build the maze shader program");
    return prog;
}

// maze and panel are streamed separately, both as Vertex arrays
static void CreateVertexStream_(uint32_t& outVao, uint32_t& outVbo)
{
    GLuint va = 0, vb = 0;
    glGenVertexArrays(1, &va);
    glBindVertexArray(va);
    glGenBuffers(1, &vb);
    glBindBuffer(GL_ARRAY_BUFFER, vb);

    glEnableVertexAttribArray(0);
    glVertexAttribPointer(0, 2, GL_FLOAT, GL_FALSE, sizeof(Vertex), (void*)offsetof(Vertex, x));
    glEnableVertexAttribArray(1);
    glVertexAttribPointer(1, 4, GL_FLOAT, GL_FALSE, sizeof(Vertex), (void*)offsetof(Vertex, r));

    glBindBuffer(GL_ARRAY_BUFFER, 0);
    glBindVertexArray(0);

    outVao = va;
    outVbo = vb;
}

static void DestroyVertexStream_(uint32_t& va, uint32_t& vb)
{
    if (vb) { GLuint b = vb; glDeleteBuffers(1, &b); vb = 0; }
    if (va) { GLuint a = va; glDeleteVertexArrays(1, &a); va = 0; }
}

static void OnFramebufferSize_(GLFWwindow* w, int width, int height)
{
    // may fire before glad is loaded, so no gl calls
    if (auto* self = static_cast<Viewer*>(glfwGetWindowUserPointer(w)))
        self->onFramebufferResized(std::max(1, width), std::max(1, height));
}

static void OnGlfwError_(int code, const char* description)
{
    std::cerr << "[glfw] error " << code << ": " << description << "\n";
}

void Viewer::initWindowAndGL()
{
    glfwSetErrorCallback(OnGlfwError_);
    if (!glfwInit())
        throw std::runtime_error("glfwInit failed");

    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
#if defined(__APPLE__)
    glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GLFW_TRUE);
#endif

    // panel on the left, square maze area on the right
    GLFWwindow* win = glfwCreateWindow(fbW, fbH, "Perfect Maze", nullptr, nullptr);
    if (!win)
    {
        glfwTerminate();
        throw std::runtime_error("could not open a 3.3 core window");
    }
    glfwSetWindowSizeLimits(win, 600, 400, GLFW_DONT_CARE, GLFW_DONT_CARE);

    window = win;
    glfwMakeContextCurrent(win);
    glfwSwapInterval(1);

    glfwSetWindowUserPointer(win, this);
    glfwSetFramebufferSizeCallback(win, OnFramebufferSize_);

    if (!gladLoadGLLoader((GLADloadproc)glfwGetProcAddress))
    {
        shutdownGL();
        throw std::runtime_error("gladLoadGLLoader failed");
    }

    int w = 1, h = 1;
    glfwGetFramebufferSize(win, &w, &h);
    onFramebufferResized(std::max(1, w), std::max(1, h));
    glViewport(0, 0, fbW, fbH);

    program = BuildCellProgram_();
    CreateVertexStream_(vao, vbo);
    CreateVertexStream_(uiVao, uiVbo);

    glEnable(GL_BLEND);
    glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);

    initUiCallbacks();
    updateWindowTitle();
}

void Viewer::shutdownGL()
{
    if (program) { glDeleteProgram(program); program = 0; }
    DestroyVertexStream_(vao, vbo);
    DestroyVertexStream_(uiVao, uiVbo);

    if (window)
    {
        glfwDestroyWindow(static_cast<GLFWwindow*>(window));
        window = nullptr;
        glfwTerminate();
    }
}
