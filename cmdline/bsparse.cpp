// This file is part of Golly.
// See docs/License.html for the copyright notice.

#include "sparselife.h"
#include "readpattern.h"
#include "writepattern.h"
#include "util.h"
#include "lifepoll.h"
#include "viewport.h"
#include "liferender.h"
#include "sparsedraw.h"
#include "lifecontrol.h"
#include <signal.h>
#include <ctype.h>
#include <stdlib.h>
#include <iostream>
#include <cstdio>
#include <string.h>
#include <string>
#include <vector>

using namespace std ;

double start ;
int maxtime = 0 ;
double timestamp() {
   double now = lifeSecondCount() ;
   double r = now - start ;
   if (start == 0)
      start = now ;
   return r ;
}

/*
 *   This is a "renderer" that is just stubs, for performance testing.
 */
class nullrender : public liferender {
public:
   nullrender() {}
   virtual ~nullrender() {}
   virtual void fill(int, int, int, int, int) {}
} ;
nullrender renderer ;

/*
 *   Ctrl-C or --maxtime stops stepping after the current generation.
 */
lifepoll interrupt_poller ;
extern "C" void oninterrupt(int) {
   interrupt_poller.setInterrupted() ;
}
void reportstop() {
   if (interrupt_poller.isTimedOut())
      lifestatus("Time limit reached.") ;
   else
      lifestatus("Interrupted.") ;
}

int benchmark ; // show timing?
/*
 *   This is our standard lifeerrors.
 */
class stderrors : public lifeerrors {
public:
   stderrors() {}
   virtual void fatal(const char *s) { cout << "Fatal error: " << s << endl ; exit(10) ; }
   virtual void warning(const char *s) { cout << "Warning: " << s << endl ; }
   virtual void status(const char *s) {
      if (benchmark)
         cout << timestamp() << " " << s << endl ;
      else {
         timestamp() ;
         cout << s << endl ;
      }
   }
} ;
stderrors stderrors_instance ;

struct options {
  const char *shortopt ;
  const char *longopt ;
  const char *desc ;
  char opttype ;
  void *data ;
} ;
int maxgen = -1 ;
int gridwd = 140, gridht = 120 ;
int originx = 8, originy = 1 ;
int cellsize = 4 ;
int render, quiet ;
int verbose ;
char *outfilename = 0 ;
char *testscript = 0 ;
options options[] = {
  { "-m", "--generation", "How far to run", 'i', &maxgen },
  { "-W", "--width", "Grid width in cells", 'i', &gridwd },
  { "-H", "--height", "Grid height in cells", 'i', &gridht },
  { "-x", "--xorigin", "Column of the pattern's top left corner", 'i', &originx },
  { "-y", "--yorigin", "Row of the pattern's top left corner", 'i', &originy },
  { "-c", "--cellsize", "Pixels per cell for click and drag", 'i', &cellsize },
  { "-T", "--maxtime", "Max duration", 'i', &maxtime },
  { "-b", "--benchmark", "Show timestamps", 'b', &benchmark },
  { "-q", "--quiet", "Don't show population; twice, don't show anything", 'b', &quiet },
  { "-o", "--output", "Output file (*.txt, *.txt.gz)", 's', &outfilename },
  { "-v", "--verbose", "Verbose", 'b', &verbose },
  { "",   "--render", "Render (benchmarking)", 'b', &render },
  { "",   "--exec", "Run testing script", 's', &testscript },
  { 0, 0, 0, 0, 0 }
} ;

const char *surfboard_gun =
   "........................o...........\n"
   "......................o.o...........\n"
   "............oo......oo............oo\n"
   "...........o...o....oo............oo\n"
   "oo........o.....o...oo..............\n"
   "oo........o...o.oo....o.o...........\n"
   "..........o.....o.......o...........\n"
   "...........o...o....................\n"
   "............oo......................\n" ;

int endswith(const char *s, const char *suff) {
   int off = (int)(strlen(s) - strlen(suff)) ;
   if (off <= 0)
      return 0 ;
   s += off ;
   while (*s)
      if (tolower(*s++) != tolower(*suff++))
         return 0 ;
   return 1 ;
}

void usage(const char *s) {
  fprintf(stderr, "Usage:  bsparse [options] [patternfile]\n") ;
  for (int i=0; options[i].shortopt; i++)
    fprintf(stderr, "%3s %-15s %s\n", options[i].shortopt, options[i].longopt,
            options[i].desc) ;
  if (s)
    lifefatal(s) ;
  exit(0) ;
}

/*
 *   Everything a run works on.  main() owns the only instance and
 *   hands it to the commands.
 */
struct session {
   session() : univ(0), view(0), control(0) {}
   ~session() { clear() ; }
   void clear() {
      delete control ;
      delete view ;
      delete univ ;
      control = 0 ;
      view = 0 ;
      univ = 0 ;
   }
   // replaces the current universe; returns an error message on failure
   const char *newuniverse(int wd, int ht) {
      const char *err = 0 ;
      sparselife *u = sparselife::create(wd, ht, &err) ;
      if (u == 0)
         return err ;
      clear() ;
      univ = u ;
      view = new viewport(wd, ht, cellsize) ;
      control = new lifecontrol(*univ, *view) ;
      return 0 ;
   }
   void showgen() {
      cout << univ->getGeneration() << ": " << univ->getPopulation() << endl ;
   }
   sparselife *univ ;
   viewport *view ;
   lifecontrol *control ;
} ;

void writepat(session &s) {
   cerr << "(->" << outfilename << flush ;
   const char *err = writepattern(outfilename, *s.univ,
                          endswith(outfilename, ".gz") ? gzip_compression
                                                       : no_compression) ;
   if (err != 0)
      lifewarning(err) ;
   cerr << ")" << flush ;
}

const int MAXCMDLENGTH = 2048 ;
struct cmdbase {
   cmdbase(const char *cmdarg, const char *argsarg) {
      verb = cmdarg ;
      args = argsarg ;
      next = list ;
      list = this ;
   }
   const char *verb ;
   const char *args ;
   int iargs[4] ;
   string sarg ;
   virtual void doit(session &) {}
   int parseargs(const char *cmdargs) {
      int iargn = 0 ;
      char sbuf[MAXCMDLENGTH+2] ;
      for (const char *rargs = args; *rargs; rargs++) {
         while (*cmdargs && *cmdargs <= ' ')
            cmdargs++ ;
         if (*cmdargs == 0) {
            lifewarning("Missing needed argument") ;
            return 0 ;
         }
         switch (*rargs) {
         case 'i':
           if (sscanf(cmdargs, "%d", iargs+iargn) != 1) {
             lifewarning("Missing needed integer argument") ;
             return 0 ;
           }
           iargn++ ;
           break ;
         case 's':
           if (sscanf(cmdargs, "%2048s", sbuf) != 1) {
             lifewarning("Missing needed string argument") ;
             return 0 ;
           }
           sarg = sbuf ;
           break ;
         default:
           lifefatal("Internal error in parseargs") ;
         }
         while (*cmdargs && *cmdargs > ' ')
           cmdargs++ ;
      }
      return 1 ;
   }
   // most commands need a universe to work on
   virtual bool needsuniverse() { return true ; }
   static void docmd(session &s, const char *cmdline) {
      for (cmdbase *cmd=list; cmd; cmd = cmd->next)
         if (strncmp(cmdline, cmd->verb, strlen(cmd->verb)) == 0 &&
             cmdline[strlen(cmd->verb)] <= ' ') {
            if (cmd->needsuniverse() && s.univ == 0) {
               lifewarning("No universe; use new first") ;
               return ;
            }
            if (cmd->parseargs(cmdline+strlen(cmd->verb))) {
               cmd->doit(s) ;
            }
            return ;
         }
      lifewarning("Didn't understand command") ;
   }
   cmdbase *next ;
   virtual ~cmdbase() {}
   static cmdbase *list ;
} ;

cmdbase *cmdbase::list = 0 ;

struct newcmd : public cmdbase {
   newcmd() : cmdbase("new", "ii") {}
   virtual bool needsuniverse() { return false ; }
   virtual void doit(session &s) {
      const char *err = s.newuniverse(iargs[0], iargs[1]) ;
      if (err != 0)
         lifewarning(err) ;
   }
} new_inst ;
struct loadcmd : public cmdbase {
   loadcmd() : cmdbase("load", "sii") {}
   virtual void doit(session &s) {
     const char *err = readpattern(sarg.c_str(), *s.univ, iargs[0], iargs[1]) ;
     if (err != 0)
       lifewarning(err) ;
   }
} load_inst ;
// rows of the pattern are separated by '/'
struct pastecmd : public cmdbase {
   pastecmd() : cmdbase("paste", "iis") {}
   virtual void doit(session &s) {
      string text = sarg ;
      for (unsigned int i=0; i<text.size(); i++)
         if (text[i] == '/')
            text[i] = '\n' ;
      s.univ->paste(text.c_str(), iargs[0], iargs[1]) ;
      cout << s.univ->getPopulation() << " cells alive." << endl ;
   }
} paste_inst ;
struct savecmd : public cmdbase {
   savecmd() : cmdbase("save", "s") {}
   virtual void doit(session &s) {
      const char *err = writepattern(sarg.c_str(), *s.univ,
                          endswith(sarg.c_str(), ".gz") ? gzip_compression
                                                        : no_compression) ;
      if (err != 0)
         lifewarning(err) ;
   }
} save_inst ;
struct stepcmd : public cmdbase {
   stepcmd() : cmdbase("step", "i") {}
   virtual void doit(session &s) {
      for (int i=0; i<iargs[0]; i++) {
         if (interrupt_poller.poll())
            break ;
         s.univ->advance(1) ;
      }
      s.showgen() ;
   }
} step_inst ;
struct showcmd : public cmdbase {
   showcmd() : cmdbase("show", "") {}
   virtual void doit(session &s) {
      s.showgen() ;
   }
} show_inst ;
struct pendingcmd : public cmdbase {
   pendingcmd() : cmdbase("pending", "") {}
   virtual void doit(session &s) {
      cout << s.univ->numpending() << " cells pending." << endl ;
   }
} pending_inst ;
struct quitcmd : public cmdbase {
   quitcmd() : cmdbase("quit", "") {}
   virtual bool needsuniverse() { return false ; }
   virtual void doit(session &) {
      cout << "Buh-bye!" << endl ;
      exit(10) ;
   }
} quit_inst ;
// set and unset take logical coordinates; cell() would wrap an x
// past the right edge onto the next row, so check them here
bool ongrid(const sparselife &univ, int x, int y) {
   return x >= 0 && x < univ.getwidth() && y >= 0 && y < univ.getheight() ;
}
struct setcmd : public cmdbase {
   setcmd() : cmdbase("set", "ii") {}
   virtual void doit(session &s) {
      if (ongrid(*s.univ, iargs[0], iargs[1]))
         s.univ->setcell(s.univ->cell(iargs[0], iargs[1]), true) ;
   }
} set_inst ;
struct unsetcmd : public cmdbase {
   unsetcmd() : cmdbase("unset", "ii") {}
   virtual void doit(session &s) {
      if (ongrid(*s.univ, iargs[0], iargs[1]))
         s.univ->setcell(s.univ->cell(iargs[0], iargs[1]), false) ;
   }
} unset_inst ;
struct helpcmd : public cmdbase {
   helpcmd() : cmdbase("help", "") {}
   virtual bool needsuniverse() { return false ; }
   virtual void doit(session &) {
      for (cmdbase *cmd=list; cmd; cmd = cmd->next)
         cout << cmd->verb << " " << cmd->args << endl ;
   }
} help_inst ;
struct getcmd : public cmdbase {
   getcmd() : cmdbase("get", "ii") {}
   virtual void doit(session &s) {
     cout << "At " << iargs[0] << "," << iargs[1] << " -> " <<
        (s.univ->getcell(iargs[0], iargs[1]) ? 1 : 0) << endl ;
   }
} get_inst ;
struct edgescmd : public cmdbase {
   edgescmd() : cmdbase("edges", "") {}
   virtual void doit(session &s) {
      int t, l, b, r ;
      if (!s.univ->findedges(&t, &l, &b, &r)) {
         cout << "Empty universe" << endl ;
         return ;
      }
      cout << "Bounding box " << l << " " << t << " .. " << r << " " << b << endl ;
   }
} edges_inst ;
// draws the grid at one pixel per cell and prints it
struct drawcmd : public cmdbase {
   drawcmd() : cmdbase("draw", "") {}
   virtual void doit(session &s) {
      int wd = s.univ->getwidth() ;
      int ht = s.univ->getheight() ;
      viewport textview(wd, ht, 1) ;
      vector<unsigned char> buf(wd * ht) ;
      staterender r(&buf[0], wd, ht) ;
      drawsparselife(*s.univ, textview, r) ;
      string line ;
      for (int y=0; y<ht; y++) {
         line.clear() ;
         for (int x=0; x<wd; x++)
            line += buf[y * wd + x] ? 'o' : '.' ;
         cout << line << endl ;
      }
   }
} draw_inst ;
struct clickcmd : public cmdbase {
   clickcmd() : cmdbase("click", "ii") {}
   virtual void doit(session &s) {
      s.control->mousedown(iargs[0], iargs[1]) ;
      cout << s.control->caption() << endl ;
   }
} click_inst ;
struct dragcmd : public cmdbase {
   dragcmd() : cmdbase("drag", "ii") {}
   virtual void doit(session &s) {
      s.control->mousedrag(iargs[0], iargs[1]) ;
   }
} drag_inst ;
// key names: a single character, "space" or "esc"
struct keycmd : public cmdbase {
   keycmd() : cmdbase("key", "s") {}
   virtual void doit(session &s) {
      int key = (unsigned char)sarg[0] ;
      if (sarg == "space")
         key = ' ' ;
      else if (sarg == "esc")
         key = KEY_ESCAPE ;
      s.control->keyup(key) ;
      cout << s.control->caption() << endl ;
   }
} key_inst ;
struct tickcmd : public cmdbase {
   tickcmd() : cmdbase("tick", "") {}
   virtual void doit(session &s) {
      if (!s.control->tick()) {
         cout << "Buh-bye!" << endl ;
         exit(0) ;
      }
      s.showgen() ;
   }
} tick_inst ;

void runtestscript(session &s, const char *testscript) {
   FILE *cmdfile = 0 ;
   if (strcmp(testscript, "-") != 0)
      cmdfile = fopen(testscript, "r") ;
   else
      cmdfile = stdin ;
   char cmdline[MAXCMDLENGTH + 10] ;
   if (cmdfile == 0)
      lifefatal("Cannot open testscript") ;
   linereader reader(cmdfile, cmdfile != stdin) ;
   for (;;) {
     if (interrupt_poller.isInterrupted()) {
        reportstop() ;
        break ;
     }
     cerr << flush ;
     if (cmdfile == stdin)
       cout << "bsparse> " << flush ;
     else
       cout << flush ;
     if (reader.fgets(cmdline, MAXCMDLENGTH) == 0)
        break ;
     // blank lines and # comments
     const char *p = cmdline ;
     while (*p && *p <= ' ')
        p++ ;
     if (*p == 0 || *p == '#')
        continue ;
     cmdbase::docmd(s, p) ;
   }
}

#define STRINGIFY(ARG) STR2(ARG)
#define STR2(ARG) #ARG
int main(int argc, char *argv[]) {
   cout << "This is bsparse " STRINGIFY(VERSION) " Copyright 2005-2018 The Golly Gang."
        << endl ;
   cout << "-" ;
   for (int i=0; i<argc; i++)
      cout << " " << argv[i] ;
   cout << endl << flush ;
   while (argc > 1 && argv[1][0] == '-' && argv[1][1] != 0) {
      argc-- ;
      argv++ ;
      char *opt = argv[0] ;
      int hit = 0 ;
      for (int i=0; options[i].shortopt; i++) {
        if (strcmp(opt, options[i].shortopt) == 0 ||
            strcmp(opt, options[i].longopt) == 0) {
          switch (options[i].opttype) {
case 'i':
             if (argc < 2)
                lifefatal("Bad option argument") ;
             *(int *)options[i].data = atol(argv[1]) ;
             argc-- ;
             argv++ ;
             break ;
case 'b':
             (*(int *)options[i].data) += 1 ;
             break ;
case 's':
             if (argc < 2)
                lifefatal("Bad option argument") ;
             *(char **)options[i].data = argv[1] ;
             argc-- ;
             argv++ ;
             break ;
          }
          hit++ ;
          break ;
        }
      }
      if (!hit)
         usage("Bad option given") ;
   }
   if (argc > 2)
      usage("Extra stuff after pattern argument") ;
   if (cellsize < 1)
      lifefatal("Cell size must be at least 1.") ;
   if (outfilename && strlen(outfilename) > 200)
      lifefatal("Output filename too long") ;
   lifeerrors::seterrorhandler(&stderrors_instance) ;
   if (verbose)
      sparselife::setVerbose(1) ;
   session s ;
   const char *err = s.newuniverse(gridwd, gridht) ;
   if (err) lifefatal(err) ;
   timestamp() ;
   if (maxtime)
      interrupt_poller.settimelimit(maxtime) ;
   signal(SIGINT, oninterrupt) ;
   if (testscript) {
      if (argc > 1) {
         err = readpattern(argv[1], *s.univ, originx, originy) ;
         if (err) lifefatal(err) ;
      }
      runtestscript(s, testscript) ;
      exit(0) ;
   }
   if (argc > 1) {
      err = readpattern(argv[1], *s.univ, originx, originy) ;
      if (err) lifefatal(err) ;
   } else {
      s.univ->paste(surfboard_gun, originx, originy) ;
   }
   for (;;) {
      if (benchmark)
         cout << timestamp() << " " ;
      else
         timestamp() ;
      if (quiet < 2) {
         cout << s.univ->getGeneration() ;
         if (!quiet)
            cout << ": " << s.univ->getPopulation() ;
         cout << endl ;
      }
      if (render)
         drawsparselife(*s.univ, *s.view, renderer) ;
      if (maxgen >= 0 && s.univ->getGeneration() >= maxgen)
         break ;
      if (s.univ->numpending() == 0) {
         lifestatus("Pattern is stable.") ;
         break ;
      }
      if (interrupt_poller.poll()) {
         reportstop() ;
         break ;
      }
      s.univ->advance(1) ;
   }
   if (outfilename != 0)
      writepat(s) ;
   return 0 ;
}
