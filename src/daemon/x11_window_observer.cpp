#include "daemon/x11_window_observer.hpp"

#include <cctype>

#include <QString>

#include "common/logging.hpp"
#include "daemon/proc_process_info.hpp"

#include <X11/Xatom.h>
#include <X11/Xlib.h>
#include <X11/Xutil.h>

namespace tracewatch {

namespace {

// Windows can disappear between the active-window query and the property
// reads; the default Xlib handler would terminate the process on BadWindow.
int ignoreXError(Display *, XErrorEvent *)
{
    return 0;
}

} // namespace

struct X11WindowObserver::Impl {
    Display *display = nullptr;
    Atom netActiveWindow = 0;
    Atom netWmName = 0;
    Atom netWmPid = 0;
    Atom wmName = 0;
    Atom utf8String = 0;

    Window activeWindow() const
    {
        Atom actualType = 0;
        int actualFormat = 0;
        unsigned long items = 0;
        unsigned long bytesAfter = 0;
        unsigned char *data = nullptr;

        const int status = XGetWindowProperty(display, DefaultRootWindow(display),
                                              netActiveWindow, 0L, 1L, False, XA_WINDOW,
                                              &actualType, &actualFormat, &items,
                                              &bytesAfter, &data);
        Window window = 0;
        if (status == Success && data) {
            if (items > 0 && actualFormat == 32) {
                window = static_cast<Window>(*reinterpret_cast<unsigned long *>(data));
            }
            XFree(data);
        }
        return window;
    }

    std::string stringProperty(Window window, Atom property, Atom type) const
    {
        Atom actualType = 0;
        int actualFormat = 0;
        unsigned long items = 0;
        unsigned long bytesAfter = 0;
        unsigned char *data = nullptr;

        const int status = XGetWindowProperty(display, window, property, 0L, (~0L), False,
                                              type, &actualType, &actualFormat, &items,
                                              &bytesAfter, &data);
        std::string value;
        if (status == Success && data) {
            if (actualFormat == 8) {
                value.assign(reinterpret_cast<const char *>(data), items);
            }
            XFree(data);
        }
        return value;
    }

    std::string windowTitle(Window window) const
    {
        std::string title = stringProperty(window, netWmName, utf8String);
        if (title.empty()) {
            // STRING properties are ISO 8859-1.
            const std::string latin1 = stringProperty(window, wmName, XA_STRING);
            title = QString::fromLatin1(latin1.data(), static_cast<int>(latin1.size()))
                        .toStdString();
        }
        return title;
    }

    std::string classInstance(Window window) const
    {
        XClassHint hint{};
        if (!XGetClassHint(display, window, &hint)) {
            return {};
        }
        std::string name = hint.res_name ? hint.res_name : "";
        if (name.empty() && hint.res_class) {
            name = hint.res_class;
        }
        if (hint.res_name) {
            XFree(hint.res_name);
        }
        if (hint.res_class) {
            XFree(hint.res_class);
        }
        for (auto &c : name) {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        return name;
    }

    int64_t windowPid(Window window) const
    {
        if (netWmPid == None) {
            return 0;
        }

        Atom actualType = 0;
        int actualFormat = 0;
        unsigned long items = 0;
        unsigned long bytesAfter = 0;
        unsigned char *data = nullptr;

        const int status = XGetWindowProperty(display, window, netWmPid, 0L, 1L, False,
                                              XA_CARDINAL, &actualType, &actualFormat,
                                              &items, &bytesAfter, &data);
        int64_t pid = 0;
        if (status == Success && data) {
            // Format-32 properties are returned as an array of long.
            if (items > 0 && actualFormat == 32) {
                pid = static_cast<int64_t>(*reinterpret_cast<unsigned long *>(data));
            }
            XFree(data);
        }
        return pid;
    }
};

X11WindowObserver::X11WindowObserver()
    : impl(std::make_unique<Impl>())
{
}

X11WindowObserver::~X11WindowObserver()
{
    if (impl->display) {
        XCloseDisplay(impl->display);
        impl->display = nullptr;
    }
}

bool X11WindowObserver::open()
{
    if (impl->display) {
        return true;
    }

    impl->display = XOpenDisplay(nullptr);
    if (!impl->display) {
        TWLOG_WARN(QStringLiteral("X11WindowObserver"),
                   QStringLiteral("open"),
                   QStringLiteral("display_unavailable"),
                   QStringLiteral("XOpenDisplay returned null"),
                   QStringLiteral("x11"),
                   ::tracewatch::logging::defaultWho(),
                   QString(),
                   nlohmann::json::object());
        return false;
    }

    XSetErrorHandler(ignoreXError);
    impl->netActiveWindow = XInternAtom(impl->display, "_NET_ACTIVE_WINDOW", False);
    impl->netWmName = XInternAtom(impl->display, "_NET_WM_NAME", False);
    impl->netWmPid = XInternAtom(impl->display, "_NET_WM_PID", True);
    impl->wmName = XInternAtom(impl->display, "WM_NAME", False);
    impl->utf8String = XInternAtom(impl->display, "UTF8_STRING", False);
    return true;
}

bool X11WindowObserver::isOpen() const
{
    return impl->display != nullptr;
}

std::optional<ForegroundWindow> X11WindowObserver::currentWindow()
{
    if (!impl->display) {
        return std::nullopt;
    }

    const Window window = impl->activeWindow();
    if (window == 0) {
        return std::nullopt;
    }

    ForegroundWindow foreground;
    foreground.windowTitle = impl->windowTitle(window);
    foreground.processId = impl->windowPid(window);
    foreground.appName = ProcProcessInfoProvider::processName(foreground.processId);
    if (foreground.appName.empty()) {
        // No _NET_WM_PID (remote or legacy clients): use the WM_CLASS instance.
        foreground.appName = impl->classInstance(window);
    }
    if (foreground.appName.empty()) {
        return std::nullopt;
    }
    return foreground;
}

} // namespace tracewatch
