// This file is part of Corrector
// Copyright (C) 2002 by Kevin Atkinson under the GNU LGPL license
// version 2.0 or 2.1.  You should have received a copy of the LGPL
// license along with this library if you did not you can find
// it at http://www.gnu.org/.

#include <locale.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include "settings.h"

#include "config.hpp"
#include "errors.hpp"
#include "fstream.hpp"
#include "gettext.h"
#include "iostream.hpp"
#include "posib_err.hpp"
#include "speller.hpp"
#include "stack_ptr.hpp"
#include "string.hpp"
#include "vector.hpp"

using namespace ccommon;

// action functions declarations

void print_ver();
void print_help();
void config();
void correct();
void list();
void suggest();
void infinitive();
void add();

void print_error(ParmString msg)
{
  CERR.printf(_("Error: %s\n"), msg.str());
}

void print_error(ParmString msg, ParmString str)
{
  CERR.put(_("Error: "));
  CERR.printf(msg.str(), str.str());
  CERR.put('\n');
}

#define EXIT_ON_ERR(command) \
  do{PosibErrBase pe(command);\
  if(pe.has_err()){print_error(pe.get_err()->mesg); exit(1);}\
  } while(false)
#define EXIT_ON_ERR_SET(command, type, var)\
  type var;\
  do{PosibErr< type > pe(command);\
  if(pe.has_err()){print_error(pe.get_err()->mesg); exit(1);}\
  else {var=pe.data;}\
  } while(false)

/////////////////////////////////////////////////////////
//
// Command line options functions and classes
// (including main)
//

typedef Vector<String> Args;
typedef Config         Options;

Args              args;
StackPtr<Options> options(new_config());

struct PossibleOption {
  const char * name;
  char         abrv;
  int          num_arg;
  bool         is_command;
};

#define OPTION(name,abrv,num)         {name,abrv,num,false}
#define COMMAND(name,abrv,num)        {name,abrv,num,true}

const PossibleOption possible_options[] = {
  OPTION("lang",            'l', 1),
  OPTION("custom-dict",     'd', 1),
  OPTION("data-dir",        '\0', 1),
  OPTION("personal",        'p', 1),
  OPTION("separator",       's', 1),
  OPTION("input",           'i', 1),
  OPTION("output",          'o', 1),
  OPTION("max-distance",    '\0', 1),
  OPTION("max-suggestions", '\0', 1),
  OPTION("verbose",         'V', 0),
  OPTION("dont-verbose",    '\0', 0),

  COMMAND("version",    'v', 0),
  COMMAND("help",       '?', 0),
  COMMAND("config",     '\0', 0),
  COMMAND("correct",    'c', 0),
  COMMAND("list",       '\0', 0),
  COMMAND("suggest",    '\0', 1),
  COMMAND("infinitive", '\0', 1),
  COMMAND("add",        'a', 1),

  {"",'\0'}, {"",'\0'}
};

const PossibleOption * possible_options_end = possible_options + sizeof(possible_options)/sizeof(PossibleOption) - 2;

const PossibleOption * find_option(char c) {
  const PossibleOption * i = possible_options;
  while (i != possible_options_end && i->abrv != c)
    ++i;
  return i;
}

static inline bool str_equal(const char * begin, const char * end,
                             const char * other)
{
  while(begin != end && *begin == *other)
    ++begin, ++other;
  return (begin == end && *other == '\0');
}

static const PossibleOption * find_option(const char * begin, const char * end) {
  const PossibleOption * i = possible_options;
  while (i != possible_options_end
         && !str_equal(begin, end, i->name))
    ++i;
  return i;
}

static const PossibleOption * find_option(const char * str) {
  const PossibleOption * i = possible_options;
  while (i != possible_options_end
         && strcmp(str, i->name) != 0)
    ++i;
  return i;
}

static bool is_command(const String & str) {
  const PossibleOption * o = find_option(str.c_str());
  return o != possible_options_end && o->is_command;
}

int main (int argc, const char *argv[])
{
  setlocale (LC_ALL, "");
  corrector_gettext_init();

  if (argc == 1) {print_help(); return 0;}

  int i = 1;
  const PossibleOption * o;
  const char           * parm;

  //
  // process command line options by setting the appropriate options
  // in "options" and/or pushing non-options onto "args"
  //
  PossibleOption other_opt = OPTION("",'\0',0);
  String option_name;
  while (i != argc) {
    if (argv[i][0] == '-' && argv[i][1] != '\0') {
      bool have_parm = false;
      if (argv[i][1] == '-') {
        // a long arg
        const char * c = argv[i] + 2;
        while(*c != '=' && *c != '\0') ++c;
        o = find_option(argv[i] + 2, c);
        if (o == possible_options_end) {
          // let the config decide, "--dont-<key>" and unknown keys
          // included
          option_name.assign(argv[i] + 2, c - argv[i] - 2);
          other_opt.name    = option_name.c_str();
          other_opt.num_arg = -1;
          o = &other_opt;
        }
        if (*c == '=') {have_parm = true; ++c;}
        parm = c;
      } else {
        // a short arg
        o = find_option(argv[i][1]);
        parm = argv[i] + 2;
        if (*parm) have_parm = true;
      }
      if (o == possible_options_end) {
        print_error(_("Invalid Option: %s"), argv[i]);
        return 1;
      }
      if (o->num_arg == 0) {
        if (parm[0] != '\0') {
          print_error(_(" does not take any parameters."),
                      String(argv[i], parm - argv[i]));
          return 1;
        }
        i += 1;
      } else if (have_parm || o->num_arg == -1) {
        i += 1;
      } else if (i + 1 == argc) {
        print_error(_("You must specify a parameter for %s"), argv[i]);
        return 1;
      } else {
        parm = argv[i + 1];
        i += 2;
      }
      if (o->is_command) {
        args.push_back(o->name);
        if (o->num_arg == 1)
          args.push_back(parm);
      } else {
        EXIT_ON_ERR(options->replace(o->name, parm));
      }
    } else {
      args.push_back(argv[i]);
      i += 1;
    }
  }

  if (args.empty()) {
    print_error(_("You must specify an action"));
    return 1;
  }

  //
  // perform the requested action, text on its own is corrected
  //
  String action_str = "correct";
  if (is_command(args.front())) {
    action_str = args.front();
    args.erase(args.begin());
  }
  if (action_str == "help")
    print_help();
  else if (action_str == "version")
    print_ver();
  else if (action_str == "config")
    config();
  else if (action_str == "correct")
    correct();
  else if (action_str == "list")
    list();
  else if (action_str == "suggest")
    suggest();
  else if (action_str == "infinitive")
    infinitive();
  else if (action_str == "add")
    add();
  else {
    print_error(_("Unknown Action: %s"),  action_str);
    return 1;
  }

  return 0;
}

///////////////////////////
//
// config
//

void config ()
{
  if (args.size() == 0) {
    options->write_to_stream(COUT);
  }
  else {
    EXIT_ON_ERR_SET(options->retrieve(args[0]), String, value);
    COUT << value << "\n";
  }
}

///////////////////////////
//
// speller based commands
//

// the speller takes over the options
static Speller * load_speller()
{
  EXIT_ON_ERR_SET(new_speller(options.release()), Speller *, speller);
  return speller;
}

static void write_result(const String & res, ParmString file)
{
  if (file.empty()) {
    COUT << res;
    if (res.empty() || res[res.size() - 1] != '\n') COUT << '\n';
    return;
  }
  FStream out;
  EXIT_ON_ERR(out.open(file, "w"));
  out << res;
  if (res.empty() || res[res.size() - 1] != '\n') out << '\n';
}

void correct()
{
  EXIT_ON_ERR_SET(options->retrieve("input"), String, input);
  EXIT_ON_ERR_SET(options->retrieve("output"), String, output);

  String text;
  if (!args.empty()) {
    for (Args::const_iterator i = args.begin(); i != args.end(); ++i) {
      if (i != args.begin()) text += ' ';
      text += *i;
    }
  } else if (!input.empty()) {
    FStream in;
    EXIT_ON_ERR(in.open(input, "r"));
    if (!in.read_all(text)) return;
  } else {
    if (!CIN.read_all(text)) return;
  }

  StackPtr<Speller> speller(load_speller());
  String res;
  speller->correct(text, res);
  write_result(res, output);
}

void list()
{
  StackPtr<Speller> speller(load_speller());
  String line;
  Vector<String> words;
  while (CIN.getline(line)) {
    words.clear();
    speller->misspelled(line, words);
    for (Vector<String>::const_iterator i = words.begin(); i != words.end(); ++i)
      COUT.printl(*i);
  }
}

void suggest()
{
  if (args.empty()) {
    print_error(_("You must specify a parameter for %s"), "suggest");
    exit(1);
  }
  StackPtr<Speller> speller(load_speller());
  const String & word = args[0];
  if (speller->check(word)) {
    COUT.printf("* %s\n", word.c_str());
    return;
  }
  Vector<String> sugs;
  speller->suggest(word, sugs);
  if (sugs.empty()) {
    COUT.printf("# %s\n", word.c_str());
    return;
  }
  COUT.printf("& %s %u: ", word.c_str(), (unsigned)sugs.size());
  for (Vector<String>::const_iterator i = sugs.begin(); i != sugs.end(); ++i) {
    if (i != sugs.begin()) COUT << ", ";
    COUT << *i;
  }
  COUT << '\n';
}

void infinitive()
{
  if (args.empty()) {
    print_error(_("You must specify a parameter for %s"), "infinitive");
    exit(1);
  }
  StackPtr<Speller> speller(load_speller());
  String inf;
  if (!speller->infinitive(args[0], inf)) {
    print_error(_("\"%s\" is not a known verb form."), args[0]);
    exit(1);
  }
  COUT.printl(inf);
}

void add()
{
  if (args.empty()) {
    print_error(_("You must specify a parameter for %s"), "add");
    exit(1);
  }
  StackPtr<Speller> speller(load_speller());
  EXIT_ON_ERR(speller->add_to_personal(args[0]));
}

///////////////////////////
//
// print_ver
//

void print_ver () {
  COUT.put("Corrector " VERSION "\n");
}

///////////////////////////
//
// print_help
//

void print_help_line(char abrv, char dont_abrv, const char * name,
                     KeyInfoType type, const char * desc)
{
  String command;
  if (abrv != '\0') {
    command += '-';
    command += abrv;
    if (dont_abrv != '\0') {
      command += '|';
      command += '-';
      command += dont_abrv;
    }
    command += ',';
  }
  command += "--";
  if (type == KeyInfoBool) command += "[dont-]";
  command += name;
  if (type == KeyInfoString)
    command += "=<str>";
  if (type == KeyInfoInt)
    command += "=<int>";
  const char * tdesc = _(desc);
  printf("  %-27s %s\n", command.c_str(), tdesc);
}

void print_help () {
  printf(
    /* TRANSLATORS: This should be formated to fit on an 80 column
     * terminal.*/
    _("\n"
      "Corrector %s.  A spelling corrector for Spanish.\n"
      "\n"
      "Usage: corrector [options] <command>\n"
      "\n"
      "<command> is one of:\n"
      "  -?|help          display this help message\n"
      "  -c|correct [<text>]\n"
      "                   corrects the text, the input file, or standard input\n"
      "  <text>           same as correct <text>\n"
      "  list             produce a list of misspelled words from standard input\n"
      "  config [<key>]   dumps the configuration or prints the value of an option\n"
      "  suggest <word>   prints the suggestions for a word\n"
      "  infinitive <word>\n"
      "                   prints the infinitive of a verb form\n"
      "  -a|add <word>    adds a word to the personal word list\n"
      "  -v|version       prints a version line\n"
      "\n"
      "[options] is any of the following:\n"
      "\n"), VERSION);
  const KeyInfo * k = options->possible_begin();
  for (; k != options->possible_end(); ++k) {
    if (k->desc == 0) continue;
    const PossibleOption * o = find_option(k->name);
    char abrv = o != possible_options_end ? o->abrv : '\0';
    print_help_line(abrv, '\0', k->name, k->type, k->desc);
  }
}
