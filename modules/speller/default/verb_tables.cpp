// This file is part of Corrector
// Copyright (C) 2026 by the Corrector authors under the GNU LGPL license
// version 2.0 or 2.1.  You should have received a copy of the LGPL
// license along with this library if you did not you can find
// it at http://www.gnu.org/.

#include "getdata.hpp"
#include "vector.hpp"
#include "verb_tables.hpp"

namespace corrector {

  const char * infinitive_suffix(VerbClass c)
  {
    switch (c) {
    case ArClass: return "ar";
    case ErClass: return "er";
    default:      return "ir";
    }
  }

  const char * stem_change_from(StemChange c)
  {
    switch (c) {
    case EToIe: case EToI: return "e";
    case OToUe:            return "o";
    case UToUe:            return "u";
    case CToZc:            return "c";
    default:               return "";
    }
  }

  const char * stem_change_to(StemChange c)
  {
    switch (c) {
    case EToIe:            return "ie";
    case OToUe: case UToUe: return "ue";
    case EToI:             return "i";
    case CToZc:            return "zc";
    default:               return "";
    }
  }

  //
  // endings
  //

  static const char * const ar_endings[] = {
    "o", "as", "a", "amos", "áis", "an",             // present
    "é", "aste", "ó", "amos", "asteis", "aron",      // preterite
    "aba", "abas", "aba", "ábamos", "abais", "aban", // imperfect
    "e", "es", "e", "emos", "éis", "en",             // subjunctive
    "ara", "aras", "ara", "áramos", "arais", "aran",
    "ase", "ases", "ase", "ásemos", "aseis", "asen",
    "are", "ares", "are", "áremos", "areis", "aren",
    "ando", "ado", "ad",
    0
  };

  static const char * const er_endings[] = {
    "o", "es", "e", "emos", "éis", "en",
    "í", "iste", "ió", "imos", "isteis", "ieron",
    "ía", "ías", "ía", "íamos", "íais", "ían",
    "a", "as", "a", "amos", "áis", "an",
    "iera", "ieras", "iera", "iéramos", "ierais", "ieran",
    "iese", "ieses", "iese", "iésemos", "ieseis", "iesen",
    "iere", "ieres", "iere", "iéremos", "iereis", "ieren",
    "iendo", "ido", "ed",
    0
  };

  static const char * const ir_endings[] = {
    "o", "es", "e", "imos", "ís", "en",
    "í", "iste", "ió", "imos", "isteis", "ieron",
    "ía", "ías", "ía", "íamos", "íais", "ían",
    "a", "as", "a", "amos", "áis", "an",
    "iera", "ieras", "iera", "iéramos", "ierais", "ieran",
    "iese", "ieses", "iese", "iésemos", "ieseis", "iesen",
    "iere", "ieres", "iere", "iéremos", "iereis", "ieren",
    "iendo", "ido", "id",
    0
  };

  const char * const * regular_endings(VerbClass c)
  {
    switch (c) {
    case ArClass: return ar_endings;
    case ErClass: return er_endings;
    default:      return ir_endings;
    }
  }

  const char * const future_endings[] = {
    "é", "ás", "á", "emos", "éis", "án", 0
  };

  const char * const conditional_endings[] = {
    "ía", "ías", "ía", "íamos", "íais", "ían", 0
  };

  static const char * const ar_stem_change_endings[] = {
    "o", "as", "a", "an", "e", "es", "e", "en", "ue", "ues", "uen", 0
  };

  static const char * const er_stem_change_endings[] = {
    "o", "es", "e", "en", "a", "as", "a", "an", 0
  };

  static const char * const ir_stem_change_endings[] = {
    "o", "es", "e", "en", "a", "as", "a", "an", "iendo", "ió", "ieron", 0
  };

  const char * const * stem_change_endings(VerbClass c)
  {
    switch (c) {
    case ArClass: return ar_stem_change_endings;
    case ErClass: return er_stem_change_endings;
    default:      return ir_stem_change_endings;
    }
  }

  const char * const zc_endings[] = {
    "o", "a", "as", "amos", "áis", "an", 0
  };

  //
  // irregular forms
  //

  struct IrregularVerb {
    const char * infinitive;
    const char * forms; // separated by a single space
  };

  static const IrregularVerb irregular_verbs[] = {
    {"ser",
     "soy eres es somos sois son fui fuiste fue fuimos fuisteis "
     "fueron era eras éramos erais eran seré serás será seremos "
     "seréis serán sería serías seríamos seríais serían sea seas "
     "seamos seáis sean fuera fueras fuéramos fuerais fueran fuese "
     "fueses fuésemos fueseis fuesen sido siendo"},
    {"estar",
     "estoy estás está estamos estáis están estuve estuviste "
     "estuvo estuvimos estuvisteis estuvieron esté estés estemos "
     "estéis estén estuviera estuvieras estuviéramos estuvierais "
     "estuvieran estuviese estuvieses estuviésemos estuvieseis "
     "estuviesen estando estado"},
    {"ir",
     "voy vas va vamos vais van iba ibas íbamos ibais iban iré "
     "irás irá iremos iréis irán iría irías iríamos iríais irían "
     "vaya vayas vayamos vayáis vayan yendo ido"},
    {"haber",
     "he has ha hay hemos habéis han hube hubiste hubo hubimos "
     "hubisteis hubieron había habías habíamos habíais habían "
     "habré habrás habrá habremos habréis habrán habría habrías "
     "habríamos habríais habrían haya hayas hayamos hayáis hayan "
     "hubiera hubieras hubiéramos hubierais hubieran hubiese "
     "hubieses hubiésemos hubieseis hubiesen habido habiendo"},
    {"tener",
     "tengo tienes tiene tenemos tenéis tienen tuve tuviste tuvo "
     "tuvimos tuvisteis tuvieron tendré tendrás tendrá tendremos "
     "tendréis tendrán tendría tendrías tendríamos tendríais "
     "tendrían tenga tengas tengamos tengáis tengan tuviera "
     "tuvieras tuviéramos tuvierais tuvieran tuviese tuvieses "
     "tuviésemos tuvieseis tuviesen tenido teniendo ten tened"},
    {"hacer",
     "hago haces hace hacemos hacéis hacen hice hiciste hizo "
     "hicimos hicisteis hicieron haré harás hará haremos haréis "
     "harán haría harías haríamos haríais harían haga hagas "
     "hagamos hagáis hagan hiciera hicieras hiciéramos hicierais "
     "hicieran hiciese hicieses hiciésemos hicieseis hiciesen "
     "hecho haciendo haz haced"},
    {"poder",
     "puedo puedes puede podemos podéis pueden pude pudiste pudo "
     "pudimos pudisteis pudieron podré podrás podrá podremos "
     "podréis podrán podría podrías podríamos podríais podrían "
     "pueda puedas podamos podáis puedan pudiera pudieras "
     "pudiéramos pudierais pudieran pudiese pudieses pudiésemos "
     "pudieseis pudiesen podido pudiendo"},
    {"querer",
     "quiero quieres quiere queremos queréis quieren quise "
     "quisiste quiso quisimos quisisteis quisieron querré querrás "
     "querrá querremos querréis querrán querría querrías "
     "querríamos querríais querrían quiera quieras queramos "
     "queráis quieran quisiera quisieras quisiéramos quisierais "
     "quisieran quisiese quisieses quisiésemos quisieseis "
     "quisiesen querido queriendo quered"},
    {"decir",
     "digo dices dice decimos decís dicen dije dijiste dijo "
     "dijimos dijisteis dijeron diré dirás dirá diremos diréis "
     "dirán diría dirías diríamos diríais dirían diga digas "
     "digamos digáis digan dijera dijeras dijéramos dijerais "
     "dijeran dijese dijeses dijésemos dijeseis dijesen dicho "
     "diciendo decid"},
    {"dar",
     "di doy das da damos dais dan diste dio dimos disteis dieron "
     "dé des demos deis den diera dieras diéramos dierais dieran "
     "diese dieses diésemos dieseis diesen dado dando"},
    {"ver",
     "veo ves ve vemos veis vi viste vio vimos visteis vieron veía "
     "veías veíamos veíais veían vea veas veamos veáis vean visto "
     "viendo"},
    {"venir",
     "ven vengo vienes viene venimos venís vienen vine viniste "
     "vino vinimos vinisteis vinieron vendré vendrás vendrá "
     "vendremos vendréis vendrán vendría vendrías vendríamos "
     "vendríais vendrían venga vengas vengamos vengáis vengan "
     "viniera vinieras viniéramos vinierais vinieran viniese "
     "vinieses viniésemos vinieseis viniesen venido viniendo venid"},
    {"saber",
     "sé sabes sabe sabemos sabéis saben supe supiste supo supimos "
     "supisteis supieron sabré sabrás sabrá sabremos sabréis "
     "sabrán sabría sabrías sabríamos sabríais sabrían sepa sepas "
     "sepamos sepáis sepan supiera supieras supiéramos supierais "
     "supieran supiese supieses supiésemos supieseis supiesen "
     "sabido sabiendo"},
    {"poner",
     "pongo pones pone ponemos ponéis ponen puse pusiste puso "
     "pusimos pusisteis pusieron pondré pondrás pondrá pondremos "
     "pondréis pondrán pondría pondrías pondríamos pondríais "
     "pondrían ponga pongas pongamos pongáis pongan pusiera "
     "pusieras pusiéramos pusierais pusieran pusiese pusieses "
     "pusiésemos pusieseis pusiesen puesto poniendo pon poned"},
    {"salir",
     "salgo sales sale salimos salís salen saldré saldrás saldrá "
     "saldremos saldréis saldrán saldría saldrías saldríamos "
     "saldríais saldrían salga salgas salgamos salgáis salgan "
     "salido saliendo sal salid"},
    {"traer",
     "traigo traes trae traemos traéis traen traje trajiste trajo "
     "trajimos trajisteis trajeron traiga traigas traigamos "
     "traigáis traigan trajera trajeras trajéramos trajerais "
     "trajeran trajese trajeses trajésemos trajeseis trajesen "
     "traído trayendo traed"},
    {"oír",
     "oigo oyes oye oímos oís oyen oí oíste oyó oísteis oyeron "
     "oiga oigas oigamos oigáis oigan oído oyendo oíd"},
    {"caer",
     "caigo caes cae caemos caéis caen caí caíste cayó caímos "
     "caísteis cayeron caiga caigas caigamos caigáis caigan cayera "
     "cayeras cayéramos cayerais cayeran cayese cayeses cayésemos "
     "cayeseis cayesen caído cayendo"},
    {"contribuir",
     "contribuyo contribuyes contribuye contribuyen contribuyó "
     "contribuyeron contribuyendo contribuya contribuyas "
     "contribuyamos contribuyan contribuyera contribuyeras "
     "contribuyeran contribuyese contribuyesen"},
    {"construir",
     "construyo construyes construye construyen construyó "
     "construyeron construyendo construya construyas construyamos "
     "construyan construyera construyeras construyeran construyese "
     "construyesen"},
    {"destruir",
     "destruyo destruyes destruye destruyen destruyó destruyeron "
     "destruyendo destruya destruyas destruyamos destruyan"},
    {"distribuir",
     "distribuyo distribuyes distribuye distribuyen distribuyó "
     "distribuyeron distribuyendo"},
    {"huir",
     "huyo huyes huye huyen huyó huyeron huyendo huya huyas "
     "huyamos huyan"},
    {"incluir",
     "incluyo incluyes incluye incluyen incluyó incluyeron "
     "incluyendo incluya incluyas incluyamos incluyan"},
    {"concluir",
     "concluyo concluyes concluye concluyen concluyó concluyeron "
     "concluyendo"},
    {"excluir",
     "excluyo excluyes excluye excluyen excluyó excluyeron "
     "excluyendo"},
    {"influir",
     "influyo influyes influye influyen influyó influyeron "
     "influyendo"},
    {"sustituir",
     "sustituyo sustituyes sustituye sustituyen sustituyó "
     "sustituyeron sustituyendo"},
    {"constituir",
     "constituyo constituyes constituye constituyen constituyó "
     "constituyeron constituyendo"},
    {"instruir",
     "instruyo instruyes instruye instruyen instruyó instruyeron "
     "instruyendo"},
    {"atribuir",
     "atribuyo atribuyes atribuye atribuyen atribuyó atribuyeron "
     "atribuyendo"},
    {"disminuir",
     "disminuyo disminuyes disminuye disminuyen disminuyó "
     "disminuyeron disminuyendo"},
    {0, 0}
  };

  // the preterite and imperfect subjunctive of the -ucir verbs
  // are built from the stem before "ucir"
  static const char * const ucir_verbs[] = {
    "conducir", "traducir", "producir", "reducir", "deducir",
    "inducir", "introducir", "reproducir", "seducir", 0
  };

  static const char * const ucir_endings[] = {
    "uje", "ujiste", "ujo", "ujimos", "ujisteis", "ujeron",
    "ujera", "ujeras", "ujéramos", "ujerais", "ujeran",
    "ujese", "ujeses", "ujésemos", "ujeseis", "ujesen",
    "ujere", "ujeres", "ujéremos", "ujereis", "ujeren",
    0
  };

  //
  // stem changes
  //

  struct StemChangeList {
    StemChange change;
    const char * verbs; // separated by a single space
  };

  static const StemChangeList stem_change_lists[] = {
    {EToIe,
     "acertar apretar atravesar calentar cerrar comenzar confesar "
     "despertar empezar encerrar gobernar helar manifestar merendar "
     "negar nevar pensar plegar recomendar regar sembrar sentar "
     "temblar tropezar "
     "ascender atender defender descender encender entender extender "
     "perder tender trascender verter "
     "advertir arrepentirse conferir consentir convertir divertir "
     "herir hervir inferir invertir mentir preferir presentir referir "
     "sentir sugerir transferir"},
    {OToUe,
     "acordar acostar almorzar apostar aprobar colgar comprobar contar "
     "costar demostrar encontrar esforzar forzar mostrar probar "
     "recordar reforzar renovar rodar rogar soltar sonar soñar tostar "
     "volar volcar "
     "absolver conmover devolver disolver doler envolver llover morder "
     "mover oler promover remover resolver revolver soler torcer volver "
     "cocer dormir morir"},
    {EToI,
     "adherir competir concebir conseguir corregir derretir despedir "
     "elegir freír gemir impedir medir pedir perseguir proseguir reír "
     "rendir repetir reñir seguir servir sonreír teñir vestir"},
    {UToUe,
     "jugar"},
    {CToZc,
     "agradecer amanecer anochecer aparecer apetecer carecer compadecer "
     "complacer conocer crecer desaparecer desconocer desobedecer "
     "embellecer empobrecer enloquecer enmudecer enorgullecer "
     "enriquecer enternecer envejecer esclarecer establecer estremecer "
     "favorecer florecer fortalecer humedecer merecer nacer obedecer "
     "obscurecer ofrecer oscurecer padecer palidecer parecer perecer "
     "permanecer pertenecer prevalecer reconocer rejuvenecer "
     "resplandecer restablecer "
     "conducir deducir inducir introducir lucir producir reducir "
     "reproducir seducir traducir"},
    {NoStemChange, 0}
  };

  void VerbTables::add_forms(const char * infinitive, const char * forms)
  {
    Vector<String> words;
    split_fields(forms, ' ', words);
    for (Vector<String>::const_iterator i = words.begin(); i != words.end(); ++i)
      irregular_[*i] = infinitive;
  }

  VerbTables::VerbTables()
  {
    for (const IrregularVerb * i = irregular_verbs; i->infinitive; ++i)
      add_forms(i->infinitive, i->forms);

    for (const char * const * v = ucir_verbs; *v; ++v) {
      String verb = *v;
      String stem = verb.without("ucir");
      for (const char * const * e = ucir_endings; *e; ++e)
        irregular_[stem + *e] = verb;
    }

    Vector<String> verbs;
    for (const StemChangeList * l = stem_change_lists; l->verbs; ++l) {
      verbs.clear();
      split_fields(l->verbs, ' ', verbs);
      for (Vector<String>::const_iterator i = verbs.begin(); i != verbs.end(); ++i)
        stem_changes_[*i] = l->change;
    }
  }

  const char * VerbTables::irregular(ParmString form) const
  {
    Irregular::const_iterator i = irregular_.find(String(form));
    if (i == irregular_.end()) return 0;
    return i->second.c_str();
  }

  StemChange VerbTables::stem_change(ParmString infinitive) const
  {
    StemChanges::const_iterator i = stem_changes_.find(String(infinitive));
    if (i == stem_changes_.end()) return NoStemChange;
    return i->second;
  }

  const VerbTables & verb_tables()
  {
    static const VerbTables tables;
    return tables;
  }

}
