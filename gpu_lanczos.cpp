#include "gpu_lanczos.h"

#include <EGL/egl.h>
#include <EGL/eglext.h>
#include <GLES3/gl3.h>

#include <cstdio>
#include <cstring>
#include <string>
#include <vector>

static void logErr(const char* msg) {
    std::fprintf(stderr, "GpuLanczos: %s\n", msg);
}

static bool checkGL(const char* where) {
    GLenum e = glGetError();
    if (e != GL_NO_ERROR) {
        std::fprintf(stderr, "GpuLanczos GL error at %s: 0x%x\n", where, e);
        return false;
    }
    return true;
}

static void drainGL() {
    for (int i = 0; i < 16 && glGetError() != GL_NO_ERROR; i++) {}
}

// ---------------- shader sources ----------------
static const char* kVertES3 = R"(#version 300 es
    in vec2 aPos;
    void main() { gl_Position = vec4(aPos, 0.0, 1.0); }
)";

static const char* kVertES2 = R"(
    attribute vec2 aPos;
    void main() { gl_Position = vec4(aPos, 0.0, 1.0); }
)";

static const char* kFragPrefixES3 = R"(#version 300 es
    precision highp float;
    out vec4 fragColor;
    #define TEXTURE texture
    #define FRAG_OUT fragColor
)";

static const char* kFragPrefixES2 = R"(
    #ifdef GL_FRAGMENT_PRECISION_HIGH
    precision highp float;
    #else
    precision mediump float;
    #endif
    #define TEXTURE texture2D
    #define FRAG_OUT gl_FragColor
)";

// Lanczos-3 over a 7x7 window. Texels are sampled at their centres (NEAREST),
// weighted by the distance to the mapped source position.
static const char* kFragLanczos = R"(
    uniform sampler2D uTex;
    uniform vec2 uSrcSize;
    uniform vec2 uDstSize;
    uniform bool uDown;

    float sinc(float x) {
        if (x == 0.0) return 1.0;
        float pix = 3.14159265359 * x;
        return sin(pix) / pix;
    }
    float lanczos(float t) {
        t = abs(t);
        if (t >= 3.0) return 0.0;
        return sinc(t) * sinc(t / 3.0);
    }

    void main() {
        vec2 srcCoord = gl_FragCoord.xy * (uSrcSize / uDstSize);
        vec2 center = srcCoord - 0.5;
        vec2 base = floor(center);
        vec2 phase = center - base;

        vec4 color = vec4(0.0);
        float total = 0.0;
        for (int dy = -3; dy <= 3; ++dy) {
            float wy = lanczos(float(dy) - phase.y);
            for (int dx = -3; dx <= 3; ++dx) {
                float w = lanczos(float(dx) - phase.x) * wy;
                vec2 texel = clamp(base + vec2(float(dx), float(dy)), vec2(0.0), uSrcSize - 1.0);
                vec4 c = TEXTURE(uTex, (texel + 0.5) / uSrcSize);
                if (uDown) c.rgb = pow(c.rgb, vec3(2.2));
                color += c * w;
                total += w;
            }
        }
        color /= total;
        if (uDown) color.rgb = pow(max(color.rgb, vec3(0.0)), vec3(1.0 / 2.2));
        FRAG_OUT = color;
    }
)";

// Identity copy from the float target onto the RGBA8 target.
static const char* kFragCopyES3 = R"(#version 300 es
    precision highp float;
    uniform highp sampler2D uTex;
    out vec4 fragColor;
    void main() { fragColor = texelFetch(uTex, ivec2(gl_FragCoord.xy), 0); }
)";

static GLuint compileShader(GLenum type, const char* src) {
    GLuint s = glCreateShader(type);
    glShaderSource(s, 1, &src, nullptr);
    glCompileShader(s);

    GLint ok = 0;
    glGetShaderiv(s, GL_COMPILE_STATUS, &ok);
    if (!ok) {
        char log[4096];
        GLsizei n = 0;
        glGetShaderInfoLog(s, sizeof(log), &n, log);
        std::fprintf(stderr, "GpuLanczos shader compile error:\n%.*s\n", (int)n, log);
        glDeleteShader(s);
        return 0;
    }
    return s;
}

static GLuint linkProgram(const char* vsSrc, const char* fsSrc) {
    GLuint vs = compileShader(GL_VERTEX_SHADER, vsSrc);
    if (!vs) return 0;
    GLuint fs = compileShader(GL_FRAGMENT_SHADER, fsSrc);
    if (!fs) { glDeleteShader(vs); return 0; }

    GLuint p = glCreateProgram();
    glAttachShader(p, vs);
    glAttachShader(p, fs);
    glBindAttribLocation(p, 0, "aPos");
    glLinkProgram(p);
    glDeleteShader(vs);
    glDeleteShader(fs);

    GLint ok = 0;
    glGetProgramiv(p, GL_LINK_STATUS, &ok);
    if (!ok) {
        char log[4096];
        GLsizei n = 0;
        glGetProgramInfoLog(p, sizeof(log), &n, log);
        std::fprintf(stderr, "GpuLanczos program link error:\n%.*s\n", (int)n, log);
        glDeleteProgram(p);
        return 0;
    }
    return p;
}

// GL objects of one resample() call, released on every exit path.
struct PassObjects {
    int& live;
    std::vector<GLuint> programs, textures, framebuffers, buffers;

    explicit PassObjects(int& counter) : live(counter) {}
    PassObjects(const PassObjects&) = delete;
    PassObjects& operator=(const PassObjects&) = delete;

    GLuint program(GLuint p) {
        if (p) { programs.push_back(p); live++; }
        return p;
    }
    GLuint texture() {
        GLuint t = 0;
        glGenTextures(1, &t);
        textures.push_back(t); live++;
        return t;
    }
    GLuint framebuffer() {
        GLuint f = 0;
        glGenFramebuffers(1, &f);
        framebuffers.push_back(f); live++;
        return f;
    }
    GLuint buffer() {
        GLuint b = 0;
        glGenBuffers(1, &b);
        buffers.push_back(b); live++;
        return b;
    }

    ~PassObjects() {
        glBindFramebuffer(GL_FRAMEBUFFER, 0);
        glUseProgram(0);
        for (GLuint p : programs) glDeleteProgram(p);
        if (!framebuffers.empty()) glDeleteFramebuffers((GLsizei)framebuffers.size(), framebuffers.data());
        if (!textures.empty()) glDeleteTextures((GLsizei)textures.size(), textures.data());
        if (!buffers.empty()) glDeleteBuffers((GLsizei)buffers.size(), buffers.data());
        live -= (int)(programs.size() + framebuffers.size() + textures.size() + buffers.size());
    }
};

static void setTexParams() {
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_NEAREST);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_NEAREST);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);
}

// Texture-backed render target; returns 0 when the framebuffer is incomplete.
static GLuint makeTarget(PassObjects& objs, GLint internalFmt, GLenum type, int w, int h, GLuint* outTex) {
    GLuint tex = objs.texture();
    glBindTexture(GL_TEXTURE_2D, tex);
    setTexParams();
    glTexImage2D(GL_TEXTURE_2D, 0, internalFmt, w, h, 0, GL_RGBA, type, nullptr);

    GLuint fbo = objs.framebuffer();
    glBindFramebuffer(GL_FRAMEBUFFER, fbo);
    glFramebufferTexture2D(GL_FRAMEBUFFER, GL_COLOR_ATTACHMENT0, GL_TEXTURE_2D, tex, 0);
    GLenum st = glCheckFramebufferStatus(GL_FRAMEBUFFER);
    glBindFramebuffer(GL_FRAMEBUFFER, 0);
    if (st != GL_FRAMEBUFFER_COMPLETE) return 0;

    *outTex = tex;
    return fbo;
}

static void drawQuad(GLuint vbo) {
    glBindBuffer(GL_ARRAY_BUFFER, vbo);
    glEnableVertexAttribArray(0);
    glVertexAttribPointer(0, 2, GL_FLOAT, GL_FALSE, 2 * sizeof(float), nullptr);
    glDrawArrays(GL_TRIANGLE_STRIP, 0, 4);
    glDisableVertexAttribArray(0);
}

static EGLContext tryContext(EGLDisplay edpy, EGLint renderableBit, EGLint version) {
    const EGLint cfgAttribs[] = {
        EGL_SURFACE_TYPE, 0,
        EGL_RENDERABLE_TYPE, renderableBit,
        EGL_RED_SIZE, 8, EGL_GREEN_SIZE, 8, EGL_BLUE_SIZE, 8,
        EGL_ALPHA_SIZE, 8,
        EGL_NONE
    };

    EGLConfig cfg;
    EGLint num = 0;
    if (!eglChooseConfig(edpy, cfgAttribs, &cfg, 1, &num) || num < 1) return EGL_NO_CONTEXT;

    const EGLint ctxAttribs[] = { EGL_CONTEXT_CLIENT_VERSION, version, EGL_NONE };
    return eglCreateContext(edpy, cfg, EGL_NO_CONTEXT, ctxAttribs);
}

void GpuLanczos::reset() {
    EGLDisplay edpy = (EGLDisplay)dpy;
    EGLContext ectx = (EGLContext)ctx;

    if (edpy && ectx) {
        eglMakeCurrent(edpy, EGL_NO_SURFACE, EGL_NO_SURFACE, EGL_NO_CONTEXT);
        eglDestroyContext(edpy, ectx);
    }
    if (edpy) eglTerminate(edpy);

    dpy = nullptr;
    ctx = nullptr;
    tier = GpuTier::NONE;
    negotiated = false;
    lastUsedFloat = false;
}

bool GpuLanczos::init() {
    reset();
    negotiated = true;

    auto eglGetPlatformDisplayEXT =
        (PFNEGLGETPLATFORMDISPLAYEXTPROC)eglGetProcAddress("eglGetPlatformDisplayEXT");
    if (!eglGetPlatformDisplayEXT) { logErr("eglGetPlatformDisplayEXT missing"); return false; }

    EGLDisplay edpy = eglGetPlatformDisplayEXT(EGL_PLATFORM_SURFACELESS_MESA, EGL_DEFAULT_DISPLAY, nullptr);
    if (edpy == EGL_NO_DISPLAY) { logErr("surfaceless display failed"); return false; }
    if (!eglInitialize(edpy, nullptr, nullptr)) { logErr("eglInitialize failed"); return false; }
    eglBindAPI(EGL_OPENGL_ES_API);

    // Highest capability first, then the baseline context.
    GpuTier t = GpuTier::GLES3;
    EGLContext ectx = tryContext(edpy, EGL_OPENGL_ES3_BIT, 3);
    if (ectx == EGL_NO_CONTEXT) {
        t = GpuTier::GLES2;
        ectx = tryContext(edpy, EGL_OPENGL_ES2_BIT, 2);
    }
    if (ectx == EGL_NO_CONTEXT) {
        logErr("no GLES3 or GLES2 context");
        eglTerminate(edpy);
        return false;
    }

    if (!eglMakeCurrent(edpy, EGL_NO_SURFACE, EGL_NO_SURFACE, ectx)) {
        logErr("eglMakeCurrent failed");
        eglDestroyContext(edpy, ectx);
        eglTerminate(edpy);
        return false;
    }

    if (t == GpuTier::GLES3 && allowFloat) {
        const char* ext = (const char*)glGetString(GL_EXTENSIONS);
        if (ext && std::strstr(ext, "GL_EXT_color_buffer_float")) t = GpuTier::GLES3_FLOAT;
    }

    dpy = (void*)edpy;
    ctx = (void*)ectx;
    tier = t;

    const char* ver = (const char*)glGetString(GL_VERSION);
    std::fprintf(stderr, "[gpu] context ready: %s (%s)\n", ver ? ver : "?",
                 t == GpuTier::GLES3_FLOAT ? "float target" : "8-bit target");
    return true;
}

ErrorKind GpuLanczos::resample(const uint8_t* src, int sw, int sh, int dw, int dh,
                               bool downsample, std::vector<uint8_t>& out) {
    if (!src || sw <= 0 || sh <= 0 || dw <= 0 || dh <= 0) return ErrorKind::DRAW_FAILURE;

    if (!negotiated) init();
    if (tier == GpuTier::NONE) return ErrorKind::GPU_UNAVAILABLE;

    EGLDisplay edpy = (EGLDisplay)dpy;
    EGLContext ectx = (EGLContext)ctx;
    if (!eglMakeCurrent(edpy, EGL_NO_SURFACE, EGL_NO_SURFACE, ectx)) {
        logErr("eglMakeCurrent failed");
        return ErrorKind::GPU_UNAVAILABLE;
    }
    drainGL();

    GLint maxTex = 0;
    glGetIntegerv(GL_MAX_TEXTURE_SIZE, &maxTex);
    if (sw > maxTex || sh > maxTex || dw > maxTex || dh > maxTex) {
        logErr("size exceeds GL_MAX_TEXTURE_SIZE");
        return ErrorKind::DRAW_FAILURE;
    }

    const bool es3 = tier >= GpuTier::GLES3;
    PassObjects objs(live);

    std::string fsSrc = std::string(es3 ? kFragPrefixES3 : kFragPrefixES2) +
                        (fragmentOverride.empty() ? std::string(kFragLanczos) : fragmentOverride);
    GLuint prog = objs.program(linkProgram(es3 ? kVertES3 : kVertES2, fsSrc.c_str()));
    if (!prog) return ErrorKind::SHADER_FAILURE;

    GLuint vbo = objs.buffer();
    static const float quad[] = { -1.f, -1.f,  1.f, -1.f,  -1.f, 1.f,  1.f, 1.f };
    glBindBuffer(GL_ARRAY_BUFFER, vbo);
    glBufferData(GL_ARRAY_BUFFER, sizeof(quad), quad, GL_STATIC_DRAW);

    // Source texture
    GLuint texSrc = objs.texture();
    glBindTexture(GL_TEXTURE_2D, texSrc);
    setTexParams();
    glPixelStorei(GL_UNPACK_ALIGNMENT, 1);
    glTexImage2D(GL_TEXTURE_2D, 0, es3 ? GL_RGBA8 : GL_RGBA, sw, sh, 0, GL_RGBA, GL_UNSIGNED_BYTE, src);
    if (!checkGL("upload source")) return ErrorKind::DRAW_FAILURE;

    // Visible RGBA8 target
    GLuint texOut = 0;
    GLuint fboOut = makeTarget(objs, es3 ? GL_RGBA8 : GL_RGBA, GL_UNSIGNED_BYTE, dw, dh, &texOut);
    if (!fboOut) {
        logErr("output target incomplete");
        return ErrorKind::DRAW_FAILURE;
    }

    // Float intermediate target
    GLuint texFloat = 0, fboFloat = 0;
    bool useFloat = false;
    if (tier == GpuTier::GLES3_FLOAT) {
        fboFloat = makeTarget(objs, GL_RGBA16F, GL_HALF_FLOAT, dw, dh, &texFloat);
        useFloat = fboFloat != 0;
        if (!useFloat) {
            std::fprintf(stderr, "[gpu] float target incomplete; rendering directly\n");
            drainGL();
        }
    }

    // Pass 1: resample
    glBindFramebuffer(GL_FRAMEBUFFER, useFloat ? fboFloat : fboOut);
    glViewport(0, 0, dw, dh);
    glDisable(GL_BLEND);
    glUseProgram(prog);
    glActiveTexture(GL_TEXTURE0);
    glBindTexture(GL_TEXTURE_2D, texSrc);
    glUniform1i(glGetUniformLocation(prog, "uTex"), 0);
    glUniform2f(glGetUniformLocation(prog, "uSrcSize"), (float)sw, (float)sh);
    glUniform2f(glGetUniformLocation(prog, "uDstSize"), (float)dw, (float)dh);
    glUniform1i(glGetUniformLocation(prog, "uDown"), downsample ? 1 : 0);
    glClearColor(0.f, 0.f, 0.f, 0.f);
    glClear(GL_COLOR_BUFFER_BIT);
    drawQuad(vbo);
    if (!checkGL("resample pass")) return ErrorKind::DRAW_FAILURE;

    // Pass 2: copy float target onto the RGBA8 target
    if (useFloat) {
        GLuint copy = objs.program(linkProgram(kVertES3, kFragCopyES3));
        if (!copy) return ErrorKind::SHADER_FAILURE;

        glBindFramebuffer(GL_FRAMEBUFFER, fboOut);
        glViewport(0, 0, dw, dh);
        glUseProgram(copy);
        glActiveTexture(GL_TEXTURE0);
        glBindTexture(GL_TEXTURE_2D, texFloat);
        glUniform1i(glGetUniformLocation(copy, "uTex"), 0);
        glClear(GL_COLOR_BUFFER_BIT);
        drawQuad(vbo);
        if (!checkGL("copy pass")) return ErrorKind::DRAW_FAILURE;
    }

    // Read back RGBA
    std::vector<uint8_t> px((size_t)dw * (size_t)dh * 4);
    glBindFramebuffer(GL_FRAMEBUFFER, fboOut);
    glPixelStorei(GL_PACK_ALIGNMENT, 1);
    glReadPixels(0, 0, dw, dh, GL_RGBA, GL_UNSIGNED_BYTE, px.data());
    if (!checkGL("glReadPixels")) return ErrorKind::DRAW_FAILURE;

    out.swap(px);
    lastUsedFloat = useFloat;
    return ErrorKind::NONE;
}

const char* GpuLanczos::backend_name() const {
    switch (tier) {
        case GpuTier::GLES3_FLOAT: return lastUsedFloat ? "GLES3+floatFBO" : "GLES3";
        case GpuTier::GLES3:       return "GLES3";
        case GpuTier::GLES2:       return "GLES2";
        default:                   return "none";
    }
}

GpuLanczos::~GpuLanczos() {
    reset();
}
