// Entry point for Windows; portable fallback for non-Windows.
#include "Shell.h"

#if defined(_WIN32)
#include <Windows.h>
int WINAPI WinMain(HINSTANCE hInstance, HINSTANCE hPrevInstance, LPSTR lpCmdLine, int nCmdShow)
{
  Shell shell;
  shell.Run();
  return 0;
}
#else
int main(int argc, char **argv)
{
  Shell shell;
  shell.Run();
  return 0;
}
#endif
